/**
 * @file progman_c_api.cpp
 * @brief progman C API Implementation
 *
 * All C++ exceptions are caught at the boundary and converted to error
 * codes.
 */

#include "progman/progman.h"
#include "progman/host.hpp"
#include "progman/remove.hpp"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

// Version is generated at build time from VERSION file
#ifndef PROGMAN_VERSION_STRING
#define PROGMAN_VERSION_STRING "unknown"
#endif

// ============================================================================
// Thread-Local Error State
// ============================================================================

namespace {

thread_local std::string g_last_error;
thread_local ProgmanStatus g_last_error_code = PROGMAN_OK;

void set_error(ProgmanStatus code, const std::string& message) {
    g_last_error_code = code;
    g_last_error = message;
}

void clear_error() {
    g_last_error_code = PROGMAN_OK;
    g_last_error.clear();
}

ProgmanStatus map_error_code(progman::ErrorCode code) {
    switch (code) {
        case progman::ErrorCode::FILE_NOT_FOUND:
            return PROGMAN_ERROR_NOT_FOUND;
        case progman::ErrorCode::PERMISSION_DENIED:
            return PROGMAN_ERROR_PERMISSION_DENIED;
        case progman::ErrorCode::NOT_A_DIRECTORY:
            return PROGMAN_ERROR_NOT_A_DIRECTORY;
        case progman::ErrorCode::ALREADY_EXISTS:
        case progman::ErrorCode::IO_ERROR:
            return PROGMAN_ERROR_IO;
        case progman::ErrorCode::INVALID_ARGUMENT:
            return PROGMAN_ERROR_INVALID_ARGUMENT;
        case progman::ErrorCode::UNKNOWN_COMMAND:
            return PROGMAN_ERROR_UNKNOWN_COMMAND;
        case progman::ErrorCode::PARSE_ERROR:
            return PROGMAN_ERROR_PARSE;
        default:
            return PROGMAN_ERROR_INTERNAL;
    }
}

// Duplicate a string for returning to C caller (caller must free)
char* duplicate_string(const std::string& s) {
    char* result = static_cast<char*>(malloc(s.size() + 1));
    if (result) {
        memcpy(result, s.c_str(), s.size() + 1);
    } else {
        set_error(PROGMAN_ERROR_INTERNAL, "out of memory");
    }
    return result;
}

} // namespace

struct ProgmanHost {
    std::unique_ptr<progman::Host> impl;

    explicit ProgmanHost(std::unique_ptr<progman::Host> h) : impl(std::move(h)) {}
};

extern "C" {

PROGMAN_CAPI int32_t progman_abi_version(void) {
    return PROGMAN_ABI_VERSION;
}

PROGMAN_CAPI const char* progman_version_string(void) {
    return PROGMAN_VERSION_STRING;
}

PROGMAN_CAPI const char* progman_get_last_error(void) {
    return g_last_error.c_str();
}

PROGMAN_CAPI ProgmanStatus progman_get_last_error_code(void) {
    return g_last_error_code;
}

PROGMAN_CAPI void progman_clear_error(void) {
    clear_error();
}

PROGMAN_CAPI void progman_free_string(char* str) {
    free(str);
}

PROGMAN_CAPI ProgmanStatus progman_remove_dir_all(const char* path) {
    clear_error();

    if (!path) {
        set_error(PROGMAN_ERROR_INVALID_ARGUMENT, "path is NULL");
        return PROGMAN_ERROR_INVALID_ARGUMENT;
    }

    try {
        auto result = progman::remove_dir_all(path);
        if (result.isErr()) {
            ProgmanStatus status = map_error_code(result.error().code());
            set_error(status, result.error().message());
            return status;
        }
        return PROGMAN_OK;
    } catch (const std::exception& e) {
        set_error(PROGMAN_ERROR_INTERNAL, e.what());
        return PROGMAN_ERROR_INTERNAL;
    } catch (...) {
        set_error(PROGMAN_ERROR_INTERNAL, "unknown error");
        return PROGMAN_ERROR_INTERNAL;
    }
}

PROGMAN_CAPI ProgmanHost* progman_host_create(const char* config_dir) {
    clear_error();

    try {
        progman::HostOptions options;
        if (config_dir) {
            options.config_dir = std::string(config_dir);
        }
        return new ProgmanHost(progman::Host::create(options));
    } catch (const std::exception& e) {
        set_error(PROGMAN_ERROR_INTERNAL, e.what());
        return nullptr;
    } catch (...) {
        set_error(PROGMAN_ERROR_INTERNAL, "unknown error");
        return nullptr;
    }
}

PROGMAN_CAPI void progman_host_destroy(ProgmanHost* host) {
    delete host;
}

PROGMAN_CAPI char* progman_host_invoke(ProgmanHost* host,
                                       const char* command,
                                       const char* args_json) {
    clear_error();

    if (!host) {
        set_error(PROGMAN_ERROR_INVALID_ARGUMENT, "host is NULL");
        return nullptr;
    }
    if (!command) {
        set_error(PROGMAN_ERROR_INVALID_ARGUMENT, "command is NULL");
        return nullptr;
    }

    try {
        nlohmann::json args = nlohmann::json::object();
        if (args_json) {
            args = nlohmann::json::parse(args_json, nullptr, false);
            if (args.is_discarded()) {
                set_error(PROGMAN_ERROR_PARSE, "arguments are not valid JSON");
                return nullptr;
            }
        }

        auto response = host->impl->invoke(command, args);
        if (!response.ok) {
            set_error(map_error_code(response.code), response.error);
        }
        return duplicate_string(response.to_json().dump());
    } catch (const std::exception& e) {
        set_error(PROGMAN_ERROR_INTERNAL, e.what());
        return nullptr;
    } catch (...) {
        set_error(PROGMAN_ERROR_INTERNAL, "unknown error");
        return nullptr;
    }
}

} // extern "C"
