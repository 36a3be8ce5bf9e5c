/**
 * progman CLI - config command
 *
 * Without flags, print the settings. With --local-path or --mirror-path,
 * update config.json.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cstdlib>

namespace progman::cli::commands {

namespace {

struct ConfigOptions {
    std::optional<std::string> local_path;
    std::optional<std::string> mirror_path;
};

int cmd_config(const GlobalOptions& opts, const ConfigOptions& config_opts) {
    auto host = make_host(opts);

    AppConfig config = host->config();
    if (config_opts.local_path || config_opts.mirror_path) {
        auto updated = host->update_config(config_opts.local_path, config_opts.mirror_path);
        if (updated.isErr()) {
            print_error(updated.error(), opts.json);
            return 1;
        }
        config = updated.value();
    }

    if (opts.json) {
        output_json({{"configDir", host->config_dir()},
                     {"localPath", config.local_path},
                     {"mirrorPath", config.mirror_path}});
    } else {
        std::cout << "config dir:  " << host->config_dir() << std::endl;
        std::cout << "local path:  " << config.local_path << std::endl;
        std::cout << "mirror path: " << config.mirror_path << std::endl;
    }
    return 0;
}

} // namespace

void setup_config(CLI::App* app, GlobalOptions& opts) {
    static ConfigOptions config_opts;

    app->add_option("--local-path", config_opts.local_path, "Library root directory");
    app->add_option("--mirror-path", config_opts.mirror_path, "Mirror directory");

    app->callback([&opts]() {
        std::exit(cmd_config(opts, config_opts));
    });
}

} // namespace progman::cli::commands
