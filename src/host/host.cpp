#include "progman/host.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace progman {

std::unique_ptr<Host> Host::create(const HostOptions& options) {
    std::string config_dir = resolve_config_dir(options.config_dir);

    AppConfig config = default_config();
    auto loaded = load_config(config_dir);
    if (loaded.isOk()) {
        config = loaded.value();
    } else {
        spdlog::warn("{} (using defaults)", loaded.error().message());
    }

    spdlog::debug("host: config dir {}", config_dir);
    spdlog::debug("host: library {}", config.local_path);

    std::unique_ptr<Host> host(new Host(std::move(config_dir), std::move(config)));

    auto registered = register_builtin_commands(host->commands_, *host);
    if (registered.isErr()) {
        // Only reachable if the built-in table itself has a duplicate name.
        throw std::logic_error(registered.error().message());
    }

    return host;
}

AppConfig Host::config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

Result<AppConfig> Host::update_config(const std::optional<std::string>& local_path,
                                      const std::optional<std::string>& mirror_path) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    AppConfig updated = config_;
    if (local_path) updated.local_path = *local_path;
    if (mirror_path) updated.mirror_path = *mirror_path;

    auto saved = save_config(config_dir_, updated);
    if (saved.isErr()) {
        return Result<AppConfig>::err(saved.error());
    }

    config_ = updated;
    return Result<AppConfig>::ok(updated);
}

} // namespace progman
