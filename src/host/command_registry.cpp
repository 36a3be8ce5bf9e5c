#include "progman/commands.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace progman {

InvokeResponse InvokeResponse::success(nlohmann::json value) {
    InvokeResponse response;
    response.ok = true;
    response.value = std::move(value);
    return response;
}

InvokeResponse InvokeResponse::failure(const Error& error) {
    InvokeResponse response;
    response.ok = false;
    response.code = error.code();
    response.error = error.message();
    return response;
}

nlohmann::json InvokeResponse::to_json() const {
    nlohmann::json j;
    j["ok"] = ok;
    if (ok) {
        j["value"] = value;
    } else {
        j["code"] = error_code_name(code);
        j["error"] = error;
    }
    return j;
}

Result<void> CommandRegistry::add(const std::string& name, CommandHandler handler) {
    if (name.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT, "command name is empty"));
    }
    if (!handler) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "command has no handler: " + name));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (handlers_.count(name) != 0) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "command already registered: " + name));
    }
    handlers_.emplace(name, std::move(handler));
    return Result<void>::ok();
}

bool CommandRegistry::has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(name) != 0;
}

std::vector<std::string> CommandRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        result.push_back(name);
    }
    return result;
}

InvokeResponse CommandRegistry::invoke(const std::string& name, const nlohmann::json& args) const {
    CommandHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(name);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        return InvokeResponse::failure(Error(ErrorCode::UNKNOWN_COMMAND, "unknown command: " + name));
    }

    spdlog::debug("invoke: {} {}", name, args.dump());

    try {
        auto result = handler(args);
        if (result.isErr()) {
            spdlog::debug("invoke: {} failed: {}", name, result.error().message());
            return InvokeResponse::failure(result.error());
        }
        return InvokeResponse::success(std::move(result.value()));
    } catch (const nlohmann::json::exception& e) {
        return InvokeResponse::failure(
            Error(ErrorCode::INVALID_ARGUMENT, e.what()).withContext(name));
    } catch (const std::exception& e) {
        spdlog::error("invoke: {} threw: {}", name, e.what());
        return InvokeResponse::failure(Error(ErrorCode::INTERNAL, e.what()).withContext(name));
    }
}

Result<std::string> require_string_arg(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key)) {
        return Result<std::string>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                              "missing argument: " + key));
    }
    if (!args[key].is_string()) {
        return Result<std::string>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                              "argument must be a string: " + key));
    }
    return Result<std::string>::ok(args[key].get<std::string>());
}

} // namespace progman
