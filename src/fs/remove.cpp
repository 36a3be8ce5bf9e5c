#include "progman/remove.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>

namespace progman {

namespace fs = std::filesystem;

namespace {

Error make_remove_error(const std::string& path, const std::error_code& ec) {
    return Error(error_code_from(ec), ec.message())
        .withContext("cannot remove '" + path + "'");
}

} // namespace

Result<void> remove_dir_all(const std::string& path) {
    spdlog::debug("remove_dir_all: {}", path);

    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    if (!ec && status.type() == fs::file_type::not_found) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
    }
    if (ec) {
        spdlog::debug("remove_dir_all: stat failed for {}: {}", path, ec.message());
        return Result<void>::err(make_remove_error(path, ec));
    }

    // A link is unlinked itself, its target is left alone.
    if (fs::is_symlink(status)) {
        fs::remove(path, ec);
        if (ec) {
            return Result<void>::err(make_remove_error(path, ec));
        }
        return Result<void>::ok();
    }

    if (!fs::is_directory(status)) {
        return Result<void>::err(make_remove_error(
            path, std::make_error_code(std::errc::not_a_directory)));
    }

    std::uintmax_t removed = fs::remove_all(path, ec);
    if (ec) {
        spdlog::debug("remove_dir_all: failed for {}: {}", path, ec.message());
        return Result<void>::err(make_remove_error(path, ec));
    }

    spdlog::debug("remove_dir_all: removed {} entries under {}", removed, path);
    return Result<void>::ok();
}

} // namespace progman
