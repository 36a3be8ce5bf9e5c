/**
 * progman CLI - delete command
 *
 * Remove one version of a program with its whole module tree.
 */

#include "../common.hpp"
#include <progman/library.hpp>
#include <CLI/CLI.hpp>

#include <cstdlib>

namespace progman::cli::commands {

namespace {

struct DeleteOptions {
    std::string program;
    std::string version;
};

int cmd_delete(const GlobalOptions& opts, const DeleteOptions& delete_opts) {
    auto host = make_host(opts);

    auto removed = delete_version(host->config().local_path,
                                  delete_opts.program, delete_opts.version);
    return finish(removed,
                  "Deleted " + delete_opts.program + " " + delete_opts.version, opts);
}

} // namespace

void setup_delete(CLI::App* app, GlobalOptions& opts) {
    static DeleteOptions delete_opts;

    app->add_option("program", delete_opts.program, "Program name")->required();
    app->add_option("version", delete_opts.version, "Version name")->required();

    app->callback([&opts]() {
        std::exit(cmd_delete(opts, delete_opts));
    });
}

} // namespace progman::cli::commands
