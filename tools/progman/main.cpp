/**
 * progman CLI - Entry Point
 *
 * Command-line host for the progman back-end.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#ifndef PROGMAN_VERSION
#define PROGMAN_VERSION "unknown"
#endif

// Forward declarations for commands
namespace progman::cli::commands {
    void setup_rm(CLI::App* app, GlobalOptions& opts);
    void setup_invoke(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_tree(CLI::App* app, GlobalOptions& opts);
    void setup_add(CLI::App* app, GlobalOptions& opts);
    void setup_delete(CLI::App* app, GlobalOptions& opts);
    void setup_config(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace progman::cli;

    CLI::App app{"progman - program version library manager"};
    app.set_version_flag("-V,--version", PROGMAN_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config-dir", opts.config_dir, "Directory holding config.json");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* rm_cmd = app.add_subcommand("rm", "Delete a directory tree");
    commands::setup_rm(rm_cmd, opts);

    auto* invoke_cmd = app.add_subcommand("invoke", "Call a back-end command by name");
    commands::setup_invoke(invoke_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List programs and versions");
    commands::setup_list(list_cmd, opts);

    auto* tree_cmd = app.add_subcommand("tree", "Show the module tree of a version");
    commands::setup_tree(tree_cmd, opts);

    auto* add_cmd = app.add_subcommand("add", "Add a program or a program version");
    commands::setup_add(add_cmd, opts);

    auto* delete_cmd = app.add_subcommand("delete", "Delete a program version");
    commands::setup_delete(delete_cmd, opts);

    auto* config_cmd = app.add_subcommand("config", "Show or change settings");
    commands::setup_config(config_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
