/**
 * progman CLI - rm command
 *
 * Delete a directory and everything beneath it. The path is used as given.
 */

#include "../common.hpp"
#include <progman/remove.hpp>
#include <CLI/CLI.hpp>

#include <cstdlib>

namespace progman::cli::commands {

namespace {

struct RmOptions {
    std::string path;
};

int cmd_rm(const GlobalOptions& opts, const RmOptions& rm_opts) {
    init_logging(opts);
    return finish(remove_dir_all(rm_opts.path), "Removed " + rm_opts.path, opts);
}

} // namespace

void setup_rm(CLI::App* app, GlobalOptions& opts) {
    static RmOptions rm_opts;

    app->add_option("path", rm_opts.path, "Directory to delete")->required();

    app->callback([&opts]() {
        std::exit(cmd_rm(opts, rm_opts));
    });
}

} // namespace progman::cli::commands
