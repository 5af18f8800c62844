#include "stowage/engine.hpp"
#include "stowage/http.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace stowage {

using json = nlohmann::json;

namespace {

std::string get_string(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

} // namespace

DockerEngineClient::DockerEngineClient(EngineConfig config) : config_(std::move(config)) {}

Result<DistributionInspection> parse_distribution_inspection(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return Result<DistributionInspection>::err(Error(ErrorCode::RESOLUTION_ERROR,
            std::string("invalid distribution inspection response: ") + e.what()));
    }

    DistributionInspection inspection;
    if (j.contains("Descriptor") && j["Descriptor"].is_object() &&
        j["Descriptor"].contains("digest") && j["Descriptor"]["digest"].is_string()) {
        inspection.digest = j["Descriptor"]["digest"].get<std::string>();
    }
    if (!is_valid_digest(inspection.digest)) {
        return Result<DistributionInspection>::err(Error(ErrorCode::RESOLUTION_ERROR,
            "distribution inspection response carries no valid digest"));
    }

    if (j.contains("Platforms") && j["Platforms"].is_array()) {
        for (const auto& p : j["Platforms"]) {
            if (!p.is_object()) continue;
            PlatformDescriptor platform;
            platform.architecture = get_string(p, "architecture");
            platform.os = get_string(p, "os");
            platform.variant = get_string(p, "variant");
            inspection.platforms.push_back(std::move(platform));
        }
    }

    return Result<DistributionInspection>::ok(std::move(inspection));
}

Result<DistributionInspection> DockerEngineClient::inspect_distribution(const ImageReference& ref) {
    HttpRequest request;
    request.unix_socket = config_.socket_path;
    request.url = "http://localhost/" + config_.api_version + "/distribution/" +
                  ref.to_string() + "/json";

    spdlog::debug("inspecting {} through {}", ref.to_string(), config_.socket_path);
    auto response = perform_request(request);
    if (!response.ok) {
        return Result<DistributionInspection>::err(Error(ErrorCode::RESOLUTION_ERROR,
            "engine unreachable at " + config_.socket_path + ": " + response.error));
    }
    if (!response.success()) {
        std::string message = "HTTP " + std::to_string(response.status);
        try {
            auto j = json::parse(response.body);
            if (j.contains("message") && j["message"].is_string()) {
                message += ": " + j["message"].get<std::string>();
            }
        } catch (const json::exception&) {
            // Engine errors are JSON; anything else leaves just the status
        }
        return Result<DistributionInspection>::err(Error(ErrorCode::RESOLUTION_ERROR,
            "failed to inspect " + ref.to_string() + ": " + message));
    }

    return parse_distribution_inspection(response.body);
}

} // namespace stowage
