/**
 * stowage CLI - pack command
 *
 * Create a bundle archive of a directory without pinning or uploading.
 */

#include "../common.hpp"
#include <stowage/archive.hpp>
#include <stowage/descriptor.hpp>
#include <stowage/digest.hpp>

#include <CLI/CLI.hpp>
#include <filesystem>
#include <fstream>

namespace stowage::cli::commands {

namespace {

struct PackOptions {
    std::string dir;
    std::string compose_file;
    std::string output;
};

int cmd_pack(const GlobalOptions& opts, const PackOptions& pack_opts) {
    setup_logging(opts);

    std::string compose_file = pack_opts.compose_file;
    if (compose_file.empty()) {
        compose_file = (std::filesystem::path(pack_opts.dir) / DESCRIPTOR_FILENAME).string();
    }

    auto descriptor = AppDescriptor::load(compose_file);
    if (descriptor.isErr()) {
        print_error(descriptor.error(), opts.json);
        return 1;
    }

    auto text = descriptor.value().serialize();
    if (text.isErr()) {
        print_error(text.error(), opts.json);
        return 1;
    }

    ConsoleEvents events(opts.json, opts.quiet);
    BundleOptions bundle;
    bundle.root = pack_opts.dir;

    auto archive = ArchiveBuilder(bundle, &events).build(text.value());
    if (archive.isErr()) {
        print_error(archive.error(), opts.json);
        return 1;
    }

    std::string output = pack_opts.output;
    if (output.empty()) {
        output = std::filesystem::path(pack_opts.dir).filename().string();
        if (output.empty() || output == ".") {
            output = "app";
        }
        output += ".tgz";
    }

    const auto& data = archive.value().data;
    std::ofstream out(output, std::ios::binary);
    if (!out || !out.write(reinterpret_cast<const char*>(data.data()),
                           static_cast<std::streamsize>(data.size()))) {
        print_error(Error(ErrorCode::ARCHIVE_ERROR, "failed to write archive: " + output), opts.json);
        return 1;
    }

    auto digest = content_digest(data);
    if (digest.isErr()) {
        print_error(digest.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["output"] = output;
        j["digest"] = digest.value();
        j["size"] = data.size();
        j["entries"] = archive.value().entries.size();
        j["events"] = events.to_json();
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "Packed " << output << " (" << archive.value().entries.size()
                  << " entries, " << data.size() << " bytes)" << std::endl;
        std::cout << "  |-> app: " << digest.value() << std::endl;
    }

    return 0;
}

} // namespace

void setup_pack(CLI::App* app, GlobalOptions& opts) {
    static PackOptions pack_opts;

    app->add_option("dir", pack_opts.dir, "Directory to pack")->required();
    app->add_option("-f,--file", pack_opts.compose_file, "Application descriptor (default: <dir>/docker-compose.yml)");
    app->add_option("-o,--output", pack_opts.output, "Output file path");

    app->callback([&opts]() {
        std::exit(cmd_pack(opts, pack_opts));
    });
}

} // namespace stowage::cli::commands
