/**
 * stowage CLI - publish command
 *
 * load -> pin -> archive -> upload -> push
 */

#include "../common.hpp"
#include <stowage/descriptor.hpp>
#include <stowage/publisher.hpp>

#include <CLI/CLI.hpp>
#include <filesystem>

namespace stowage::cli::commands {

namespace {

struct PublishOptions {
    std::string target;
    std::string compose_file;
    std::string dir = ".";
    bool engine = false;
    bool no_pin = false;
};

int cmd_publish(const GlobalOptions& opts, const PublishOptions& publish_opts) {
    setup_logging(opts);

    std::string compose_file = publish_opts.compose_file;
    if (compose_file.empty()) {
        compose_file = (std::filesystem::path(publish_opts.dir) / DESCRIPTOR_FILENAME).string();
    }

    auto descriptor = AppDescriptor::load(compose_file);
    if (descriptor.isErr()) {
        print_error(descriptor.error(), opts.json);
        return 1;
    }

    ConsoleEvents events(opts.json, opts.quiet);

    if (!publish_opts.no_pin) {
        auto pinned = pin_descriptor(opts, publish_opts.engine, descriptor.value(), &events);
        if (pinned.isErr()) {
            print_error(pinned.error(), opts.json);
            return 1;
        }
    } else {
        spdlog::debug("skipping image pinning");
    }

    BundleOptions bundle;
    bundle.root = publish_opts.dir;

    HttpRegistryClient registry(resolve_client_config(opts));
    BundlePublisher publisher(registry, &events);

    auto result = publisher.publish(descriptor.value(), publish_opts.target, bundle);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    const auto& published = result.value();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["reference"] = published.reference;
        j["tag"] = published.tag;
        j["blob_digest"] = published.blob_digest;
        j["manifest_digest"] = published.manifest_digest;
        j["archive_size"] = published.archive_size;
        j["events"] = events.to_json();
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "Published " << published.reference << std::endl;
    }

    return 0;
}

} // namespace

void setup_publish(CLI::App* app, GlobalOptions& opts) {
    static PublishOptions publish_opts;

    app->add_option("target", publish_opts.target, "Target reference, e.g. registry.example.com/team/app:v1")->required();
    app->add_option("-f,--file", publish_opts.compose_file, "Application descriptor (default: <dir>/docker-compose.yml)");
    app->add_option("--dir", publish_opts.dir, "Bundle root directory");
    app->add_flag("--engine", publish_opts.engine, "Resolve digests through the local container engine");
    app->add_flag("--no-pin", publish_opts.no_pin, "Publish service images as written");

    app->callback([&opts]() {
        std::exit(cmd_publish(opts, publish_opts));
    });
}

} // namespace stowage::cli::commands
