#include "progman/host.hpp"
#include "progman/library.hpp"
#include "progman/remove.hpp"

namespace progman {

namespace {

using json = nlohmann::json;

nlohmann::json config_to_json(const AppConfig& config) {
    return json{{"localPath", config.local_path}, {"mirrorPath", config.mirror_path}};
}

Result<std::optional<std::string>> optional_string_arg(const json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    if (!args[key].is_string()) {
        return Result<std::optional<std::string>>::err(
            Error(ErrorCode::INVALID_ARGUMENT, "argument must be a string: " + key));
    }
    return Result<std::optional<std::string>>::ok(args[key].get<std::string>());
}

Result<json> cmd_remove_dir_all(const json& args) {
    auto path = require_string_arg(args, "path");
    if (path.isErr()) return Result<json>::err(path.error());

    auto removed = remove_dir_all(path.value());
    if (removed.isErr()) return Result<json>::err(removed.error());
    return Result<json>::ok(nullptr);
}

Result<json> cmd_get_config(const Host& host) {
    return Result<json>::ok(config_to_json(host.config()));
}

Result<json> cmd_save_config(Host& host, const json& args) {
    auto local = optional_string_arg(args, "localPath");
    if (local.isErr()) return Result<json>::err(local.error());
    auto mirror = optional_string_arg(args, "mirrorPath");
    if (mirror.isErr()) return Result<json>::err(mirror.error());

    auto updated = host.update_config(local.value(), mirror.value());
    if (updated.isErr()) return Result<json>::err(updated.error());
    return Result<json>::ok(config_to_json(updated.value()));
}

Result<json> cmd_list_programs(const Host& host) {
    auto programs = scan_library(host.config().local_path);
    if (programs.isErr()) return Result<json>::err(programs.error());

    json out = json::array();
    for (const auto& program : programs.value()) {
        out.push_back(to_json(program));
    }
    return Result<json>::ok(out);
}

Result<json> cmd_read_module_tree(const json& args) {
    auto path = require_string_arg(args, "path");
    if (path.isErr()) return Result<json>::err(path.error());

    json out = json::array();
    for (const auto& node : read_module_tree(path.value())) {
        out.push_back(to_json(node));
    }
    return Result<json>::ok(out);
}

Result<json> cmd_add_program(const Host& host, const json& args) {
    auto name = require_string_arg(args, "name");
    if (name.isErr()) return Result<json>::err(name.error());

    auto created = add_program(host.config().local_path, name.value());
    if (created.isErr()) return Result<json>::err(created.error());
    return Result<json>::ok(json{{"path", created.value()}});
}

Result<json> cmd_add_version(const Host& host, const json& args) {
    auto program = require_string_arg(args, "program");
    if (program.isErr()) return Result<json>::err(program.error());
    auto version = require_string_arg(args, "version");
    if (version.isErr()) return Result<json>::err(version.error());

    auto created = add_version(host.config().local_path, program.value(), version.value());
    if (created.isErr()) return Result<json>::err(created.error());
    return Result<json>::ok(json{{"path", created.value()}});
}

Result<json> cmd_delete_version(const Host& host, const json& args) {
    auto program = require_string_arg(args, "program");
    if (program.isErr()) return Result<json>::err(program.error());
    auto version = require_string_arg(args, "version");
    if (version.isErr()) return Result<json>::err(version.error());

    auto removed = delete_version(host.config().local_path, program.value(), version.value());
    if (removed.isErr()) return Result<json>::err(removed.error());
    return Result<json>::ok(nullptr);
}

} // namespace

Result<void> register_builtin_commands(CommandRegistry& registry, Host& host) {
    Host* h = &host;

    const std::pair<const char*, CommandHandler> table[] = {
        {"remove_dir_all", cmd_remove_dir_all},
        {"get_config", [h](const json&) { return cmd_get_config(*h); }},
        {"save_config", [h](const json& args) { return cmd_save_config(*h, args); }},
        {"list_programs", [h](const json&) { return cmd_list_programs(*h); }},
        {"read_module_tree", cmd_read_module_tree},
        {"add_program", [h](const json& args) { return cmd_add_program(*h, args); }},
        {"add_version", [h](const json& args) { return cmd_add_version(*h, args); }},
        {"delete_version", [h](const json& args) { return cmd_delete_version(*h, args); }},
    };

    for (const auto& [name, handler] : table) {
        auto added = registry.add(name, handler);
        if (added.isErr()) return added;
    }
    return Result<void>::ok();
}

} // namespace progman
