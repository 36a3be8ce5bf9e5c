/**
 * progman CLI - add command
 *
 * `add <program>` creates a program, `add <program> <version>` a version.
 */

#include "../common.hpp"
#include <progman/library.hpp>
#include <CLI/CLI.hpp>

#include <cstdlib>

namespace progman::cli::commands {

namespace {

struct AddOptions {
    std::string program;
    std::string version;
};

int cmd_add(const GlobalOptions& opts, const AddOptions& add_opts) {
    auto host = make_host(opts);
    std::string root = host->config().local_path;

    auto created = add_opts.version.empty()
        ? add_program(root, add_opts.program)
        : add_version(root, add_opts.program, add_opts.version);

    if (created.isErr()) {
        print_error(created.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"path", created.value()}});
    } else {
        print_success("Created " + created.value(), opts);
    }
    return 0;
}

} // namespace

void setup_add(CLI::App* app, GlobalOptions& opts) {
    static AddOptions add_opts;

    app->add_option("program", add_opts.program, "Program name")->required();
    app->add_option("version", add_opts.version, "Version name");

    app->callback([&opts]() {
        std::exit(cmd_add(opts, add_opts));
    });
}

} // namespace progman::cli::commands
