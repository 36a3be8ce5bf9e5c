#pragma once

/**
 * @file commands.hpp
 * @brief Named commands callable through the host's call bridge
 *
 * A CommandRegistry maps command names to handlers. Handlers take a JSON
 * object of arguments and return a JSON value or an Error. The registry is
 * built explicitly at start-up and passed to whatever serves callers; there
 * is no process-wide dispatch table.
 *
 * @example
 * ```cpp
 * progman::CommandRegistry registry;
 * registry.add("remove_dir_all", [](const nlohmann::json& args) {
 *     ...
 * });
 * auto response = registry.invoke("remove_dir_all", {{"path", "/tmp/x"}});
 * std::cout << response.to_json().dump() << "\n";
 * ```
 */

#include "progman/export.hpp"
#include "progman/result.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace progman {

using CommandHandler = std::function<Result<nlohmann::json>(const nlohmann::json& args)>;

/**
 * @brief Outcome of one command invocation, as seen by the caller
 *
 * Serialized as {"ok": true, "value": ...} or
 * {"ok": false, "code": "<error_code_name>", "error": "<message>"}.
 */
struct InvokeResponse {
    bool ok = false;
    nlohmann::json value;
    ErrorCode code = ErrorCode::INTERNAL;
    std::string error;

    static InvokeResponse success(nlohmann::json value);
    static InvokeResponse failure(const Error& error);

    nlohmann::json to_json() const;
};

/**
 * @brief Table of named command handlers
 *
 * invoke() may be called concurrently from any number of threads. The
 * handler itself runs outside the registry lock, so concurrent calls are
 * not serialized against each other.
 */
class PROGMAN_API CommandRegistry {
public:
    CommandRegistry() = default;
    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    /// Register a handler; empty or duplicate names are rejected
    Result<void> add(const std::string& name, CommandHandler handler);

    bool has(const std::string& name) const;

    /// Registered command names, sorted
    std::vector<std::string> names() const;

    /**
     * @brief Run a command once and report its outcome
     *
     * Never throws: an unknown name, a handler error or an exception
     * escaping the handler all come back as a failed response.
     */
    InvokeResponse invoke(const std::string& name, const nlohmann::json& args) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, CommandHandler> handlers_;
};

// ============================================================================
// Argument helpers for handlers
// ============================================================================

/// Fetch a required string argument
PROGMAN_API Result<std::string> require_string_arg(const nlohmann::json& args, const std::string& key);

} // namespace progman
