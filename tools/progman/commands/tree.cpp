/**
 * progman CLI - tree command
 */

#include "../common.hpp"
#include <progman/library.hpp>
#include <progman/platform.hpp>
#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>

namespace progman::cli::commands {

namespace {

struct TreeOptions {
    std::string program;
    std::string version;
};

void print_nodes(const std::vector<FileNode>& nodes, int depth) {
    for (const auto& node : nodes) {
        std::cout << std::string(static_cast<size_t>(depth) * 2, ' ') << node.name;
        if (node.is_directory) std::cout << "/";
        std::cout << std::endl;
        print_nodes(node.children, depth + 1);
    }
}

int cmd_tree(const GlobalOptions& opts, const TreeOptions& tree_opts) {
    auto host = make_host(opts);

    for (const auto* name : {&tree_opts.program, &tree_opts.version}) {
        auto valid = validate_entry_name(*name);
        if (valid.isErr()) {
            print_error(valid.error(), opts.json);
            return 1;
        }
    }

    std::string path = join_path(join_path(host->config().local_path, tree_opts.program),
                                 tree_opts.version);
    if (!std::filesystem::is_directory(path)) {
        print_error(Error(ErrorCode::FILE_NOT_FOUND,
                          "no such version: " + tree_opts.program + " " + tree_opts.version),
                    opts.json);
        return 1;
    }

    auto nodes = read_module_tree(path);

    if (opts.json) {
        nlohmann::json result = nlohmann::json::array();
        for (const auto& node : nodes) {
            result.push_back(to_json(node));
        }
        output_json(result);
    } else {
        print_nodes(nodes, 0);
    }
    return 0;
}

} // namespace

void setup_tree(CLI::App* app, GlobalOptions& opts) {
    static TreeOptions tree_opts;

    app->add_option("program", tree_opts.program, "Program name")->required();
    app->add_option("version", tree_opts.version, "Version name")->required();

    app->callback([&opts]() {
        std::exit(cmd_tree(opts, tree_opts));
    });
}

} // namespace progman::cli::commands
