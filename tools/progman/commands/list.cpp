/**
 * progman CLI - list command
 *
 * List programs in the library and their versions.
 */

#include "../common.hpp"
#include <progman/library.hpp>
#include <CLI/CLI.hpp>

#include <cstdlib>

namespace progman::cli::commands {

namespace {

int cmd_list(const GlobalOptions& opts) {
    auto host = make_host(opts);
    std::string root = host->config().local_path;

    auto programs = scan_library(root);
    if (programs.isErr()) {
        print_error(programs.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json result = nlohmann::json::array();
        for (const auto& program : programs.value()) {
            result.push_back(to_json(program));
        }
        output_json(result);
        return 0;
    }

    if (programs.value().empty()) {
        std::cout << "No programs in " << root << std::endl;
        return 0;
    }

    for (const auto& program : programs.value()) {
        std::cout << program.name << std::endl;
        for (const auto& version : program.versions) {
            std::cout << "  " << version.version << std::endl;
        }
    }
    return 0;
}

} // namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_list(opts));
    });
}

} // namespace progman::cli::commands
