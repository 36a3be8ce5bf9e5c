/**
 * progman CLI - Common utilities and types
 */

#pragma once

#include <progman/host.hpp>
#include <progman/result.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace progman::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config_dir;        // --config-dir
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route library logging to stderr at a level matching the flags.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::stderr_color_mt("progman");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%^[%l]%$ %v");

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

inline std::unique_ptr<Host> make_host(const GlobalOptions& opts) {
    init_logging(opts);

    HostOptions host_opts;
    if (!opts.config_dir.empty()) {
        host_opts.config_dir = opts.config_dir;
    }
    return Host::create(host_opts);
}

/**
 * Output utilities.
 */
inline void print_error(const Error& err, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["code"] = error_code_name(err.code());
        j["error"] = err.message();
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << err.message() << std::endl;
    }
}

inline void print_success(const std::string& msg, const GlobalOptions& opts) {
    if (!opts.json && !opts.quiet) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

/**
 * Report a value-less outcome the same way in every command.
 */
inline int finish(const Result<void>& result, const std::string& success_msg,
                  const GlobalOptions& opts) {
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }
    if (opts.json) {
        output_json({{"ok", true}});
    } else {
        print_success(success_msg, opts);
    }
    return 0;
}

} // namespace progman::cli
