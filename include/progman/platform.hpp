#pragma once

#include "progman/export.hpp"

#include <optional>
#include <string>

namespace progman {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
PROGMAN_API AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes
PROGMAN_API std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
PROGMAN_API std::string get_parent_directory(const std::string& path);

// Join path components
PROGMAN_API std::string join_path(const std::string& base, const std::string& rel);

// Read a whole file, nullopt if it cannot be opened
PROGMAN_API std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable (unset and empty both yield nullopt)
PROGMAN_API std::optional<std::string> get_env(const std::string& name);

} // namespace progman
