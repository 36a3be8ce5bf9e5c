#include "progman/library.hpp"
#include "progman/platform.hpp"
#include "progman/remove.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace progman {

namespace fs = std::filesystem;

namespace {

struct DirEntry {
    std::string name;
    std::string path;
    bool is_directory = false;
};

// Entries of one directory. Symlinks are reported as plain entries and are
// never descended into.
Result<std::vector<DirEntry>> list_entries(const std::string& path) {
    std::vector<DirEntry> entries;

    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        return Result<std::vector<DirEntry>>::err(
            Error(error_code_from(ec), ec.message()).withContext("cannot read '" + path + "'"));
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;

        DirEntry entry;
        entry.name = it->path().filename().string();
        entry.path = to_portable_path(it->path().string());

        std::error_code type_ec;
        entry.is_directory = it->is_directory(type_ec) && !it->is_symlink(type_ec);
        entries.push_back(std::move(entry));
    }

    if (ec) {
        return Result<std::vector<DirEntry>>::err(
            Error(error_code_from(ec), ec.message()).withContext("cannot read '" + path + "'"));
    }

    return Result<std::vector<DirEntry>>::ok(std::move(entries));
}

bool by_name(const DirEntry& a, const DirEntry& b) {
    return a.name < b.name;
}

std::vector<FileNode> read_tree_entries(const std::vector<DirEntry>& entries) {
    std::vector<FileNode> nodes;
    nodes.reserve(entries.size());

    for (const auto& entry : entries) {
        FileNode node;
        node.name = entry.name;
        node.path = entry.path;
        node.is_directory = entry.is_directory;

        if (node.is_directory) {
            auto children = list_entries(entry.path);
            if (children.isOk()) {
                node.children = read_tree_entries(children.value());
            } else {
                spdlog::warn("{}", children.error().message());
            }
        }

        nodes.push_back(std::move(node));
    }

    std::sort(nodes.begin(), nodes.end(), [](const FileNode& a, const FileNode& b) {
        if (a.is_directory != b.is_directory) return a.is_directory;
        return a.name < b.name;
    });

    return nodes;
}

} // namespace

std::vector<FileNode> read_module_tree(const std::string& path) {
    auto entries = list_entries(path);
    if (entries.isErr()) {
        spdlog::debug("{}", entries.error().message());
        return {};
    }
    return read_tree_entries(entries.value());
}

Result<std::vector<Program>> scan_library(const std::string& root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return Result<std::vector<Program>>::err(
            Error(error_code_from(ec), ec.message()).withContext("cannot create '" + root + "'"));
    }

    auto program_entries = list_entries(root);
    if (program_entries.isErr()) {
        return Result<std::vector<Program>>::err(program_entries.error());
    }

    auto& dirs = program_entries.value();
    std::sort(dirs.begin(), dirs.end(), by_name);

    std::vector<Program> programs;
    for (const auto& program_entry : dirs) {
        if (!program_entry.is_directory) continue;

        Program program;
        program.name = program_entry.name;

        auto version_entries = list_entries(program_entry.path);
        if (version_entries.isErr()) {
            spdlog::warn("{}", version_entries.error().message());
        } else {
            auto& versions = version_entries.value();
            std::sort(versions.begin(), versions.end(), by_name);

            for (const auto& version_entry : versions) {
                if (!version_entry.is_directory) continue;

                ProgramVersion version;
                version.version = version_entry.name;
                version.path = version_entry.path;
                version.modules = read_module_tree(version_entry.path);
                program.versions.push_back(std::move(version));
            }
        }

        programs.push_back(std::move(program));
    }

    return Result<std::vector<Program>>::ok(std::move(programs));
}

Result<void> validate_entry_name(const std::string& name) {
    if (name.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT, "name is empty"));
    }
    if (name == "." || name == "..") {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "name must not be '" + name + "'"));
    }
    if (name.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "name must be a single path component: " + name));
    }
    return Result<void>::ok();
}

namespace {

Result<std::string> create_entry_directory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return Result<std::string>::err(
            Error(error_code_from(ec), ec.message()).withContext("cannot create '" + path + "'"));
    }
    if (!fs::is_directory(path, ec)) {
        return Result<std::string>::err(
            Error(ErrorCode::ALREADY_EXISTS, "exists and is not a directory")
                .withContext("cannot create '" + path + "'"));
    }
    return Result<std::string>::ok(path);
}

} // namespace

Result<std::string> add_program(const std::string& root, const std::string& name) {
    auto valid = validate_entry_name(name);
    if (valid.isErr()) {
        return Result<std::string>::err(valid.error().withContext("program"));
    }

    spdlog::debug("add_program: {} in {}", name, root);
    return create_entry_directory(join_path(root, name));
}

Result<std::string> add_version(const std::string& root,
                                const std::string& program,
                                const std::string& version) {
    auto valid = validate_entry_name(program);
    if (valid.isErr()) {
        return Result<std::string>::err(valid.error().withContext("program"));
    }
    valid = validate_entry_name(version);
    if (valid.isErr()) {
        return Result<std::string>::err(valid.error().withContext("version"));
    }

    spdlog::debug("add_version: {}@{} in {}", program, version, root);
    return create_entry_directory(join_path(join_path(root, program), version));
}

Result<void> delete_version(const std::string& root,
                            const std::string& program,
                            const std::string& version) {
    auto valid = validate_entry_name(program);
    if (valid.isErr()) {
        return Result<void>::err(valid.error().withContext("program"));
    }
    valid = validate_entry_name(version);
    if (valid.isErr()) {
        return Result<void>::err(valid.error().withContext("version"));
    }

    return remove_dir_all(join_path(join_path(root, program), version));
}

nlohmann::json to_json(const FileNode& node) {
    nlohmann::json j;
    j["name"] = node.name;
    j["path"] = node.path;
    j["isDirectory"] = node.is_directory;
    if (node.is_directory) {
        j["children"] = nlohmann::json::array();
        for (const auto& child : node.children) {
            j["children"].push_back(to_json(child));
        }
    }
    return j;
}

nlohmann::json to_json(const ProgramVersion& version) {
    nlohmann::json j;
    j["version"] = version.version;
    j["path"] = version.path;
    j["modules"] = nlohmann::json::array();
    for (const auto& node : version.modules) {
        j["modules"].push_back(to_json(node));
    }
    return j;
}

nlohmann::json to_json(const Program& program) {
    nlohmann::json j;
    j["name"] = program.name;
    j["versions"] = nlohmann::json::array();
    for (const auto& version : program.versions) {
        j["versions"].push_back(to_json(version));
    }
    return j;
}

} // namespace progman
