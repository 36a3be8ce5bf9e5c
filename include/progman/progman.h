/**
 * @file progman.h
 * @brief progman C API - stable ABI for GUI hosts
 *
 * A host application (a GUI shell, a scripting runtime, anything with a C
 * FFI) loads progman and routes its front end's calls through this API.
 *
 * ## Design Principles
 *
 * 1. **Opaque handles**: ProgmanHost is an opaque struct.
 *
 * 2. **Ownership**: Functions returning `char*` return newly allocated
 *    strings that the caller must free with `progman_free_string()`.
 *
 * 3. **Error handling**: Fallible operations return a status code or NULL.
 *    Use `progman_get_last_error()` for details. Errors are thread-local.
 *
 * 4. **No exceptions**: The C++ implementation catches all exceptions
 *    and converts them to error codes.
 *
 * ## Example
 *
 * ```c
 * #include <progman/progman.h>
 * #include <stdio.h>
 *
 * int main(void) {
 *     if (progman_remove_dir_all("/tmp/old-build") != PROGMAN_OK) {
 *         fprintf(stderr, "Error: %s\n", progman_get_last_error());
 *         return 1;
 *     }
 *
 *     ProgmanHost* host = progman_host_create(NULL);
 *     char* programs = progman_host_invoke(host, "list_programs", "{}");
 *     printf("%s\n", programs);
 *     progman_free_string(programs);
 *     progman_host_destroy(host);
 *     return 0;
 * }
 * ```
 *
 * ## Thread Safety
 *
 * - `progman_remove_dir_all()` and `progman_host_invoke()` may be called
 *   from several threads at once; calls are not coordinated with each other.
 * - `progman_get_last_error()` is thread-local.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef PROGMAN_H
#define PROGMAN_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

#define PROGMAN_ABI_VERSION 1

#if defined(_WIN32) || defined(_WIN64)
    #ifdef PROGMAN_BUILDING_SHARED
        #define PROGMAN_CAPI __declspec(dllexport)
    #elif defined(PROGMAN_SHARED)
        #define PROGMAN_CAPI __declspec(dllimport)
    #else
        #define PROGMAN_CAPI
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef PROGMAN_BUILDING_SHARED
        #define PROGMAN_CAPI __attribute__((visibility("default")))
    #else
        #define PROGMAN_CAPI
    #endif
#else
    #define PROGMAN_CAPI
#endif

/** @brief Opaque handle to a progman host instance */
typedef struct ProgmanHost ProgmanHost;

/* ============================================================================
 * Status Codes
 * ============================================================================ */

typedef enum {
    PROGMAN_OK = 0,
    PROGMAN_ERROR_NOT_FOUND = 1,
    PROGMAN_ERROR_PERMISSION_DENIED = 2,
    PROGMAN_ERROR_NOT_A_DIRECTORY = 3,
    PROGMAN_ERROR_IO = 4,
    PROGMAN_ERROR_INVALID_ARGUMENT = 5,
    PROGMAN_ERROR_UNKNOWN_COMMAND = 6,
    PROGMAN_ERROR_PARSE = 7,
    PROGMAN_ERROR_INTERNAL = 99
} ProgmanStatus;

/* ============================================================================
 * Version
 * ============================================================================ */

PROGMAN_CAPI int32_t progman_abi_version(void);

/** @brief Library version string (borrowed, do not free) */
PROGMAN_CAPI const char* progman_version_string(void);

/* ============================================================================
 * Error Handling
 * ============================================================================ */

/** @brief Message of the last error on this thread; empty if none */
PROGMAN_CAPI const char* progman_get_last_error(void);

PROGMAN_CAPI ProgmanStatus progman_get_last_error_code(void);

PROGMAN_CAPI void progman_clear_error(void);

/* ============================================================================
 * Memory Management
 * ============================================================================ */

/** @brief Free a string returned by this API. NULL is allowed. */
PROGMAN_CAPI void progman_free_string(char* str);

/* ============================================================================
 * Commands
 * ============================================================================ */

/**
 * @brief Delete a directory and everything beneath it
 *
 * The path is used as given. On failure the OS error description is
 * available from progman_get_last_error().
 */
PROGMAN_CAPI ProgmanStatus progman_remove_dir_all(const char* path);

/* ============================================================================
 * Host Lifecycle
 * ============================================================================ */

/**
 * @brief Create a host with its built-in commands registered
 * @param config_dir Directory holding config.json, or NULL for the default
 * @return Host handle, or NULL on error
 */
PROGMAN_CAPI ProgmanHost* progman_host_create(const char* config_dir);

/** @brief Destroy a host. NULL is allowed. */
PROGMAN_CAPI void progman_host_destroy(ProgmanHost* host);

/**
 * @brief Invoke a named command
 *
 * @param args_json JSON object of arguments; NULL means {}
 * @return JSON response envelope (caller must free), or NULL when the
 *         arguments could not be handed to the command at all. A command
 *         that runs and fails still returns an envelope with "ok": false,
 *         and also sets the thread's last error.
 */
PROGMAN_CAPI char* progman_host_invoke(ProgmanHost* host,
                                       const char* command,
                                       const char* args_json);

#ifdef __cplusplus
}
#endif

#endif /* PROGMAN_H */
