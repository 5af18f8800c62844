/**
 * stowage CLI - pin command
 *
 * Rewrite every service image of a descriptor to its content digest.
 */

#include "../common.hpp"
#include <stowage/descriptor.hpp>

#include <CLI/CLI.hpp>
#include <fstream>

namespace stowage::cli::commands {

namespace {

struct PinOptions {
    std::string compose_file;
    std::string output;
    bool engine = false;
};

int cmd_pin(const GlobalOptions& opts, const PinOptions& pin_opts) {
    setup_logging(opts);

    auto descriptor = AppDescriptor::load(pin_opts.compose_file);
    if (descriptor.isErr()) {
        print_error(descriptor.error(), opts.json);
        return 1;
    }

    // Progress goes to stderr when the descriptor itself is written to stdout
    bool to_stdout = pin_opts.output.empty() || pin_opts.output == "-";
    ConsoleEvents events(opts.json, opts.quiet, to_stdout ? std::cerr : std::cout);

    auto pinned = pin_descriptor(opts, pin_opts.engine, descriptor.value(), &events);
    if (pinned.isErr()) {
        print_error(pinned.error(), opts.json);
        return 1;
    }

    auto text = descriptor.value().serialize();
    if (text.isErr()) {
        print_error(text.error(), opts.json);
        return 1;
    }

    if (!to_stdout) {
        std::ofstream out(pin_opts.output, std::ios::binary);
        if (!out || !(out << text.value())) {
            print_error(Error(ErrorCode::INPUT_ERROR,
                              "failed to write descriptor: " + pin_opts.output), opts.json);
            return 1;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["events"] = events.to_json();
        nlohmann::json services = nlohmann::json::object();
        for (const auto& [name, service] : descriptor.value().services()) {
            services[name] = service.image;
        }
        j["services"] = services;
        if (to_stdout) {
            j["descriptor"] = text.value();
        } else {
            j["output"] = pin_opts.output;
        }
        output_json(j);
    } else if (to_stdout) {
        std::cout << text.value();
    }

    return 0;
}

} // namespace

void setup_pin(CLI::App* app, GlobalOptions& opts) {
    static PinOptions pin_opts;

    app->add_option("compose-file", pin_opts.compose_file, "Application descriptor")->required();
    app->add_option("-o,--output", pin_opts.output, "Write the pinned descriptor here (default: stdout)");
    app->add_flag("--engine", pin_opts.engine, "Resolve digests through the local container engine");

    app->callback([&opts]() {
        std::exit(cmd_pin(opts, pin_opts));
    });
}

} // namespace stowage::cli::commands
