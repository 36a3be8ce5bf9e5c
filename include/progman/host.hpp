#pragma once

/**
 * @file host.hpp
 * @brief Back-end wiring behind the host application's call bridge
 *
 * A Host owns the loaded configuration and a CommandRegistry filled with
 * the built-in commands. Whatever front end drives progman (the CLI, the C
 * API, a GUI shell) creates one Host and routes calls to invoke().
 *
 * @example
 * ```cpp
 * auto host = progman::Host::create({});
 * auto response = host->invoke("remove_dir_all", {{"path", "/tmp/old-build"}});
 * if (!response.ok) {
 *     std::cerr << response.error << "\n";
 * }
 * ```
 */

#include "progman/commands.hpp"
#include "progman/config.hpp"
#include "progman/export.hpp"
#include "progman/result.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace progman {

struct HostOptions {
    std::optional<std::string> config_dir;  // see resolve_config_dir()
};

class PROGMAN_API Host {
public:
    /**
     * @brief Load configuration and register the built-in commands
     *
     * An unreadable or malformed config.json is reported as a warning and
     * the defaults are used.
     */
    static std::unique_ptr<Host> create(const HostOptions& options);

    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

    const std::string& config_dir() const { return config_dir_; }

    /// Snapshot of the current configuration
    AppConfig config() const;

    /// Apply the given fields, persist config.json, and return the result
    Result<AppConfig> update_config(const std::optional<std::string>& local_path,
                                    const std::optional<std::string>& mirror_path);

    const CommandRegistry& commands() const { return commands_; }
    CommandRegistry& commands() { return commands_; }

    InvokeResponse invoke(const std::string& name, const nlohmann::json& args) const {
        return commands_.invoke(name, args);
    }

private:
    Host(std::string config_dir, AppConfig config)
        : config_dir_(std::move(config_dir)), config_(std::move(config)) {}

    std::string config_dir_;

    mutable std::mutex config_mutex_;
    AppConfig config_;

    CommandRegistry commands_;
};

/**
 * @brief Register remove_dir_all and the library/config commands
 *
 * Handlers capture @p host by reference; the registry must not outlive it.
 */
PROGMAN_API Result<void> register_builtin_commands(CommandRegistry& registry, Host& host);

} // namespace progman
