/**
 * stowage CLI - Common utilities and types
 */

#pragma once

#include <stowage/engine.hpp>
#include <stowage/events.hpp>
#include <stowage/pinner.hpp>
#include <stowage/registry.hpp>
#include <stowage/result.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace stowage::cli {

inline std::string safe_getenv(const char* name) {
    const char* val = std::getenv(name);
    return val ? val : "";
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;                          // --json
    bool verbose = false;                       // -v, --verbose
    bool quiet = false;                         // -q, --quiet
    std::string engine_socket;                  // --engine-socket
    std::vector<std::string> insecure_registries; // --insecure-registry
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * Resolve the engine socket path.
 * Priority: --engine-socket > STOWAGE_ENGINE_SOCKET > DOCKER_HOST (unix://) > default
 */
inline std::string resolve_engine_socket(const std::string& override_socket) {
    if (!override_socket.empty()) {
        return override_socket;
    }

    std::string env_socket = safe_getenv("STOWAGE_ENGINE_SOCKET");
    if (!env_socket.empty()) {
        return env_socket;
    }

    std::string docker_host = safe_getenv("DOCKER_HOST");
    if (docker_host.rfind("unix://", 0) == 0) {
        return docker_host.substr(7);
    }

    return DEFAULT_ENGINE_SOCKET;
}

inline std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto begin = item.find_first_not_of(" \t");
        if (begin == std::string::npos) continue;
        auto end = item.find_last_not_of(" \t");
        items.push_back(item.substr(begin, end - begin + 1));
    }
    return items;
}

inline ClientConfig resolve_client_config(const GlobalOptions& opts) {
    ClientConfig config;
    config.insecure_registries = opts.insecure_registries;
    for (const auto& domain : split_list(safe_getenv("STOWAGE_INSECURE_REGISTRIES"))) {
        config.insecure_registries.push_back(domain);
    }
    config.username = safe_getenv("STOWAGE_REGISTRY_USER");
    config.password = safe_getenv("STOWAGE_REGISTRY_PASSWORD");
    config.user_agent = std::string("stowage/") + STOWAGE_VERSION;
    return config;
}

inline EngineConfig resolve_engine_config(const GlobalOptions& opts) {
    EngineConfig config;
    config.socket_path = resolve_engine_socket(opts.engine_socket);
    return config;
}

/**
 * Set the spdlog level.
 * Priority: -v/-q > STOWAGE_LOG_LEVEL > info
 */
inline void setup_logging(const GlobalOptions& opts) {
    spdlog::set_pattern("%^%l%$: %v");

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    if (opts.quiet || opts.json) {
        spdlog::set_level(spdlog::level::err);
        return;
    }

    std::string level = safe_getenv("STOWAGE_LOG_LEVEL");
    if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Pin every service of `descriptor`, resolving digests through the local
 * engine (use_engine) or directly against the registries.
 */
inline Status pin_descriptor(const GlobalOptions& opts, bool use_engine,
                             AppDescriptor& descriptor, EventSink* events) {
    if (use_engine) {
        DockerEngineClient engine(resolve_engine_config(opts));
        EngineDigestResolver resolver(engine);
        return ReferencePinner(resolver, events).pin_images(descriptor);
    }

    HttpRegistryClient registry(resolve_client_config(opts));
    RegistryDigestResolver resolver(registry);
    return ReferencePinner(resolver, events).pin_images(descriptor);
}

// ============================================================================
// Presentation
// ============================================================================

/**
 * Formats core events as status lines, or collects them for JSON output.
 */
class ConsoleEvents : public EventSink {
public:
    ConsoleEvents(bool json_mode, bool quiet, std::ostream& out = std::cout)
        : json_mode_(json_mode), quiet_(quiet), out_(out) {}

    void emit(const Event& event) override {
        if (json_mode_) {
            nlohmann::json j;
            j["event"] = event_kind_to_string(event.kind);
            for (const auto& [key, value] : event.fields) {
                j[key] = value;
            }
            events_.push_back(j);
            return;
        }
        if (quiet_) {
            return;
        }

        switch (event.kind) {
            case EventKind::service_pinning:
                out_ << "Pinning " << event.field("service") << "("
                     << event.field("image") << ")" << std::endl;
                break;
            case EventKind::service_pinned:
                if (!event.field("platforms").empty()) {
                    out_ << "  | " << event.field("platforms") << std::endl;
                }
                out_ << "  |-> " << event.field("pinned") << std::endl;
                break;
            case EventKind::pattern_ignored:
                out_ << "  |-> ignoring: " << event.field("pattern") << std::endl;
                break;
            case EventKind::blob_uploaded:
                out_ << "  |-> app: " << event.field("digest") << std::endl;
                break;
            case EventKind::manifest_pushed:
                out_ << "  |-> manifest: " << event.field("digest") << std::endl;
                break;
        }
    }

    nlohmann::json to_json() const { return events_; }

private:
    bool json_mode_;
    bool quiet_;
    std::ostream& out_;
    nlohmann::json events_ = nlohmann::json::array();
};

inline void print_error(const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.message();
        j["kind"] = error_code_to_string(error.code());
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << error.toString() << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace stowage::cli
