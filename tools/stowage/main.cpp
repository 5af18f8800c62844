/**
 * stowage CLI - Entry Point
 *
 * Pin, pack and publish multi-service applications as registry artifacts.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace stowage::cli::commands {
    void setup_pin(CLI::App* app, GlobalOptions& opts);
    void setup_pack(CLI::App* app, GlobalOptions& opts);
    void setup_publish(CLI::App* app, GlobalOptions& opts);
    void setup_inspect(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace stowage::cli;

    CLI::App app{"stowage - ship compose applications through a container registry"};
    app.set_version_flag("-V,--version", STOWAGE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");
    app.add_option("--insecure-registry", opts.insecure_registries,
                   "Registry domain reached over plain HTTP (repeatable)");
    app.add_option("--engine-socket", opts.engine_socket, "Container engine unix socket");

    // Commands
    auto* pin_cmd = app.add_subcommand("pin", "Pin service images to digests");
    commands::setup_pin(pin_cmd, opts);

    auto* pack_cmd = app.add_subcommand("pack", "Create a bundle archive of a directory");
    commands::setup_pack(pack_cmd, opts);

    auto* publish_cmd = app.add_subcommand("publish", "Pin, archive and push an application");
    commands::setup_publish(publish_cmd, opts);

    auto* inspect_cmd = app.add_subcommand("inspect", "List the entries of a bundle archive");
    commands::setup_inspect(inspect_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
