#include <doctest/doctest.h>
#include <progman/result.hpp>

#include <string>
#include <system_error>

using namespace progman;

TEST_CASE("error_code_from maps OS errors") {
    CHECK(error_code_from(std::make_error_code(std::errc::no_such_file_or_directory)) ==
          ErrorCode::FILE_NOT_FOUND);
    CHECK(error_code_from(std::make_error_code(std::errc::permission_denied)) ==
          ErrorCode::PERMISSION_DENIED);
    CHECK(error_code_from(std::make_error_code(std::errc::operation_not_permitted)) ==
          ErrorCode::PERMISSION_DENIED);
    CHECK(error_code_from(std::make_error_code(std::errc::not_a_directory)) ==
          ErrorCode::NOT_A_DIRECTORY);
    CHECK(error_code_from(std::make_error_code(std::errc::file_exists)) ==
          ErrorCode::ALREADY_EXISTS);
    CHECK(error_code_from(std::make_error_code(std::errc::device_or_resource_busy)) ==
          ErrorCode::IO_ERROR);
    CHECK(error_code_from(std::make_error_code(std::errc::read_only_file_system)) ==
          ErrorCode::IO_ERROR);
    CHECK(error_code_from(std::make_error_code(std::errc::too_many_symbolic_link_levels)) ==
          ErrorCode::IO_ERROR);
}

TEST_CASE("error_code_name is stable") {
    CHECK(std::string(error_code_name(ErrorCode::FILE_NOT_FOUND)) == "file_not_found");
    CHECK(std::string(error_code_name(ErrorCode::PERMISSION_DENIED)) == "permission_denied");
    CHECK(std::string(error_code_name(ErrorCode::NOT_A_DIRECTORY)) == "not_a_directory");
    CHECK(std::string(error_code_name(ErrorCode::UNKNOWN_COMMAND)) == "unknown_command");
    CHECK(std::string(error_code_name(ErrorCode::INTERNAL)) == "internal");
}

TEST_CASE("Error::withContext prefixes the message") {
    Error err(ErrorCode::IO_ERROR, "Device or resource busy");
    err.withContext("cannot remove '/mnt/x'");

    CHECK(err.code() == ErrorCode::IO_ERROR);
    CHECK(err.message() == "cannot remove '/mnt/x': Device or resource busy");
    CHECK(err.toString() == err.message());
}

TEST_CASE("Result holds either a value or an error") {
    SUBCASE("ok") {
        auto r = Result<int>::ok(42);
        CHECK(r.isOk());
        CHECK_FALSE(r.isErr());
        CHECK(r.value() == 42);
        CHECK(r.valueOr(7) == 42);
    }

    SUBCASE("err") {
        auto r = Result<int>::err(Error(ErrorCode::FILE_NOT_FOUND, "gone"));
        CHECK(r.isErr());
        CHECK(r.error().code() == ErrorCode::FILE_NOT_FOUND);
        CHECK(r.valueOr(7) == 7);
    }

    SUBCASE("map keeps the error") {
        auto r = Result<int>::err(Error(ErrorCode::IO_ERROR, "bad"));
        auto mapped = r.map([](int v) { return std::to_string(v); });
        REQUIRE(mapped.isErr());
        CHECK(mapped.error().message() == "bad");
    }

    SUBCASE("void") {
        CHECK(Result<void>::ok().isOk());
        auto r = Result<void>::err(Error(ErrorCode::INTERNAL, "boom"));
        CHECK(r.isErr());
        CHECK(r.error().message() == "boom");
    }
}
