#include "progman/result.hpp"

namespace progman {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::FILE_NOT_FOUND: return "file_not_found";
        case ErrorCode::PERMISSION_DENIED: return "permission_denied";
        case ErrorCode::NOT_A_DIRECTORY: return "not_a_directory";
        case ErrorCode::ALREADY_EXISTS: return "already_exists";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::UNKNOWN_COMMAND: return "unknown_command";
        case ErrorCode::PARSE_ERROR: return "parse_error";
        case ErrorCode::INTERNAL: return "internal";
    }
    return "internal";
}

ErrorCode error_code_from(const std::error_code& ec) {
    // Compare against portable conditions so Win32 and errno values both map.
    if (ec == std::errc::no_such_file_or_directory) {
        return ErrorCode::FILE_NOT_FOUND;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ErrorCode::PERMISSION_DENIED;
    }
    if (ec == std::errc::not_a_directory) {
        return ErrorCode::NOT_A_DIRECTORY;
    }
    if (ec == std::errc::file_exists) {
        return ErrorCode::ALREADY_EXISTS;
    }
    return ErrorCode::IO_ERROR;
}

} // namespace progman
