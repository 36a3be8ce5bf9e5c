/**
 * @file c_api_tests.cpp
 * @brief Tests for the progman C API
 *
 * NULL safety, error reporting and memory ownership across the C boundary.
 */

#include <doctest/doctest.h>
#include <progman/progman.h>

#include "../test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

TEST_CASE("C API: version") {
    CHECK(progman_abi_version() == PROGMAN_ABI_VERSION);
    const char* version = progman_version_string();
    REQUIRE(version != nullptr);
    CHECK(strlen(version) > 0);
}

TEST_CASE("C API: progman_remove_dir_all") {
    SUBCASE("removes a tree") {
        TempTestDir temp;
        std::string target = temp.file("victim");
        write_test_file(target + "/f.txt");

        CHECK(progman_remove_dir_all(target.c_str()) == PROGMAN_OK);
        CHECK(progman_get_last_error_code() == PROGMAN_OK);
        CHECK(strlen(progman_get_last_error()) == 0);
        CHECK_FALSE(fs::exists(target));
    }

    SUBCASE("missing path sets a thread-local error") {
        CHECK(progman_remove_dir_all("/nonexistent/path/xyz") == PROGMAN_ERROR_NOT_FOUND);
        CHECK(progman_get_last_error_code() == PROGMAN_ERROR_NOT_FOUND);
        CHECK(strlen(progman_get_last_error()) > 0);
    }

    SUBCASE("NULL path") {
        CHECK(progman_remove_dir_all(nullptr) == PROGMAN_ERROR_INVALID_ARGUMENT);
    }

    SUBCASE("clear_error resets state") {
        progman_remove_dir_all(nullptr);
        progman_clear_error();
        CHECK(progman_get_last_error_code() == PROGMAN_OK);
    }
}

TEST_CASE("C API: host lifecycle and invoke") {
    TempTestDir temp;

    progman_host_destroy(nullptr);

    ProgmanHost* host = progman_host_create(temp.file("config").c_str());
    REQUIRE(host != nullptr);

    SUBCASE("successful command") {
        std::string target = temp.file("victim");
        write_test_file(target + "/f.txt");
        std::string args = nlohmann::json{{"path", target}}.dump();

        char* out = progman_host_invoke(host, "remove_dir_all", args.c_str());
        REQUIRE(out != nullptr);
        auto j = nlohmann::json::parse(out);
        progman_free_string(out);

        CHECK(j["ok"] == true);
        CHECK_FALSE(fs::exists(target));
    }

    SUBCASE("failing command still returns an envelope") {
        char* out = progman_host_invoke(host, "remove_dir_all", R"({"path": "/nonexistent/path/xyz"})");
        REQUIRE(out != nullptr);
        auto j = nlohmann::json::parse(out);
        progman_free_string(out);

        CHECK(j["ok"] == false);
        CHECK(j["code"] == "file_not_found");
        CHECK(progman_get_last_error_code() == PROGMAN_ERROR_NOT_FOUND);
    }

    SUBCASE("NULL args means an empty object") {
        char* out = progman_host_invoke(host, "get_config", nullptr);
        REQUIRE(out != nullptr);
        auto j = nlohmann::json::parse(out);
        progman_free_string(out);
        CHECK(j["ok"] == true);
        CHECK(j["value"].contains("localPath"));
    }

    SUBCASE("invalid JSON arguments") {
        CHECK(progman_host_invoke(host, "remove_dir_all", "{oops") == nullptr);
        CHECK(progman_get_last_error_code() == PROGMAN_ERROR_PARSE);
    }

    SUBCASE("NULL host or command") {
        CHECK(progman_host_invoke(nullptr, "get_config", "{}") == nullptr);
        CHECK(progman_get_last_error_code() == PROGMAN_ERROR_INVALID_ARGUMENT);
        CHECK(progman_host_invoke(host, nullptr, "{}") == nullptr);
        CHECK(progman_get_last_error_code() == PROGMAN_ERROR_INVALID_ARGUMENT);
    }

    SUBCASE("unknown command") {
        char* out = progman_host_invoke(host, "open_window", "{}");
        REQUIRE(out != nullptr);
        progman_free_string(out);
        CHECK(progman_get_last_error_code() == PROGMAN_ERROR_UNKNOWN_COMMAND);
    }

    progman_host_destroy(host);
}
