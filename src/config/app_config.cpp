#include "progman/config.hpp"
#include "progman/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>

namespace progman {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

std::string resolve_config_dir(const std::optional<std::string>& override_dir) {
    if (override_dir && !override_dir->empty()) {
        return *override_dir;
    }

    if (auto env_dir = get_env("PROGMAN_CONFIG_DIR")) {
        return *env_dir;
    }

    if (auto xdg = get_env("XDG_CONFIG_HOME")) {
        return join_path(*xdg, "progman");
    }

    if (auto home = get_env("HOME")) {
        return join_path(*home, ".config/progman");
    }

    if (auto appdata = get_env("APPDATA")) {
        return join_path(*appdata, "progman");
    }

    return ".progman";
}

std::string default_library_path() {
    if (auto env_library = get_env("PROGMAN_LIBRARY")) {
        return *env_library;
    }

    if (auto home = get_env("HOME")) {
        return join_path(*home, "ProgramManager");
    }

    if (auto userprofile = get_env("USERPROFILE")) {
        return join_path(*userprofile, "ProgramManager");
    }

    return "ProgramManager";
}

AppConfig default_config() {
    AppConfig config;
    config.local_path = default_library_path();
    return config;
}

Result<AppConfig> parse_config(const std::string& json_str, const std::string& source_path) {
    AppConfig config = default_config();

    nlohmann::json j = nlohmann::json::parse(json_str, nullptr, false);
    if (j.is_discarded()) {
        return Result<AppConfig>::err(
            Error(ErrorCode::PARSE_ERROR, "invalid JSON").withContext(source_path.empty() ? "config" : source_path));
    }
    if (!j.is_object()) {
        return Result<AppConfig>::err(
            Error(ErrorCode::PARSE_ERROR, "JSON must be an object").withContext(source_path.empty() ? "config" : source_path));
    }

    if (auto local = get_string(j, "localPath")) {
        config.local_path = *local;
    }
    if (auto mirror = get_string(j, "mirrorPath")) {
        config.mirror_path = *mirror;
    }

    return Result<AppConfig>::ok(config);
}

std::string serialize_config(const AppConfig& config) {
    nlohmann::json j;
    j["localPath"] = config.local_path;
    j["mirrorPath"] = config.mirror_path;
    return j.dump(2);
}

Result<AppConfig> load_config(const std::string& config_dir) {
    std::string path = join_path(config_dir, CONFIG_FILENAME);

    auto content = read_file(path);
    if (!content) {
        spdlog::debug("no config at {}, using defaults", path);
        return Result<AppConfig>::ok(default_config());
    }

    return parse_config(*content, path);
}

Result<void> save_config(const std::string& config_dir, const AppConfig& config) {
    std::error_code ec;
    std::filesystem::create_directories(config_dir, ec);
    if (ec) {
        return Result<void>::err(Error(error_code_from(ec), ec.message())
                                     .withContext("cannot create '" + config_dir + "'"));
    }

    std::string path = join_path(config_dir, CONFIG_FILENAME);
    auto write = atomic_write_file(path, serialize_config(config) + "\n");
    if (!write.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, write.error)
                                     .withContext("cannot write '" + path + "'"));
    }

    spdlog::debug("saved config to {}", path);
    return Result<void>::ok();
}

} // namespace progman
