/**
 * stowage CLI - inspect command
 *
 * List the entries of a bundle archive.
 */

#include "../common.hpp"
#include <stowage/archive.hpp>

#include <CLI/CLI.hpp>
#include <fstream>
#include <iomanip>
#include <iterator>

namespace stowage::cli::commands {

namespace {

struct InspectOptions {
    std::string archive;
};

const char* kind_name(ArchiveEntryKind kind) {
    switch (kind) {
        case ArchiveEntryKind::Regular: return "file";
        case ArchiveEntryKind::Symlink: return "symlink";
        case ArchiveEntryKind::Directory: return "dir";
    }
    return "file";
}

int cmd_inspect(const GlobalOptions& opts, const InspectOptions& inspect_opts) {
    setup_logging(opts);

    std::ifstream file(inspect_opts.archive, std::ios::binary);
    if (!file) {
        print_error(Error(ErrorCode::INPUT_ERROR,
                          "failed to read archive: " + inspect_opts.archive), opts.json);
        return 1;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());

    auto entries = read_archive(data);
    if (entries.isErr()) {
        print_error(entries.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["entries"] = nlohmann::json::array();
        for (const auto& entry : entries.value()) {
            nlohmann::json e;
            e["name"] = entry.name;
            e["kind"] = kind_name(entry.kind);
            e["size"] = entry.size;
            e["mode"] = entry.mode;
            if (entry.kind == ArchiveEntryKind::Symlink) {
                e["linkname"] = entry.linkname;
            }
            j["entries"].push_back(e);
        }
        output_json(j);
        return 0;
    }

    for (const auto& entry : entries.value()) {
        std::cout << std::setw(7) << kind_name(entry.kind) << " "
                  << std::oct << std::setw(4) << std::setfill('0') << entry.mode
                  << std::dec << std::setfill(' ') << " "
                  << std::setw(10) << entry.size << "  " << entry.name;
        if (entry.kind == ArchiveEntryKind::Symlink) {
            std::cout << " -> " << entry.linkname;
        }
        std::cout << std::endl;
    }

    return 0;
}

} // namespace

void setup_inspect(CLI::App* app, GlobalOptions& opts) {
    static InspectOptions inspect_opts;

    app->add_option("archive", inspect_opts.archive, "Bundle archive (.tgz)")->required();

    app->callback([&opts]() {
        std::exit(cmd_inspect(opts, inspect_opts));
    });
}

} // namespace stowage::cli::commands
