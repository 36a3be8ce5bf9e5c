/**
 * progman CLI - invoke command
 *
 * Generic call bridge: run one registered command with JSON arguments and
 * print its response envelope.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cstdlib>

namespace progman::cli::commands {

namespace {

struct InvokeOptions {
    std::string command;
    std::string args = "{}";
    bool list = false;
};

int cmd_invoke(const GlobalOptions& opts, const InvokeOptions& invoke_opts) {
    auto host = make_host(opts);

    if (invoke_opts.list) {
        auto names = host->commands().names();
        if (opts.json) {
            output_json(names);
        } else {
            for (const auto& name : names) {
                std::cout << name << std::endl;
            }
        }
        return 0;
    }

    if (invoke_opts.command.empty()) {
        print_error(Error(ErrorCode::INVALID_ARGUMENT, "no command given"), opts.json);
        return 1;
    }

    auto args = nlohmann::json::parse(invoke_opts.args, nullptr, false);
    if (args.is_discarded()) {
        print_error(Error(ErrorCode::PARSE_ERROR, "--args is not valid JSON"), opts.json);
        return 1;
    }

    auto response = host->invoke(invoke_opts.command, args);
    output_json(response.to_json());
    return response.ok ? 0 : 1;
}

} // namespace

void setup_invoke(CLI::App* app, GlobalOptions& opts) {
    static InvokeOptions invoke_opts;

    app->add_option("command", invoke_opts.command, "Command name");
    app->add_option("--args", invoke_opts.args, "Arguments as a JSON object");
    app->add_flag("--list", invoke_opts.list, "List registered commands");

    app->callback([&opts]() {
        std::exit(cmd_invoke(opts, invoke_opts));
    });
}

} // namespace progman::cli::commands
