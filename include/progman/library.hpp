#pragma once

/**
 * @file library.hpp
 * @brief The on-disk program library
 *
 * Layout under the library root:
 *
 *   <root>/<program>/<version>/<module files...>
 *
 * Every directory directly under the root is a program, every directory
 * under a program is a version, and everything under a version is its
 * module tree. Regular files at program or version level are ignored.
 */

#include "progman/export.hpp"
#include "progman/result.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace progman {

struct FileNode {
    std::string name;
    std::string path;
    bool is_directory = false;
    std::vector<FileNode> children;
};

struct ProgramVersion {
    std::string version;
    std::string path;
    std::vector<FileNode> modules;
};

struct Program {
    std::string name;
    std::vector<ProgramVersion> versions;
};

/**
 * @brief List a directory tree
 *
 * Directories sort before files, then by name. A subdirectory that cannot
 * be read gets an empty children list; an unreadable or missing root gives
 * an empty result.
 */
PROGMAN_API std::vector<FileNode> read_module_tree(const std::string& path);

/**
 * @brief Scan the library root, creating it if it does not exist yet
 * @return Programs sorted by name, each with versions sorted by name
 */
PROGMAN_API Result<std::vector<Program>> scan_library(const std::string& root);

/// Check that a program or version name is a single, plain path component
PROGMAN_API Result<void> validate_entry_name(const std::string& name);

/// Create <root>/<name>; an existing directory is not an error
PROGMAN_API Result<std::string> add_program(const std::string& root, const std::string& name);

/// Create <root>/<program>/<version>; an existing directory is not an error
PROGMAN_API Result<std::string> add_version(const std::string& root,
                                            const std::string& program,
                                            const std::string& version);

/// Remove <root>/<program>/<version> and its module tree
PROGMAN_API Result<void> delete_version(const std::string& root,
                                        const std::string& program,
                                        const std::string& version);

// JSON shapes handed to callers of the command bridge
PROGMAN_API nlohmann::json to_json(const FileNode& node);
PROGMAN_API nlohmann::json to_json(const ProgramVersion& version);
PROGMAN_API nlohmann::json to_json(const Program& program);

} // namespace progman
