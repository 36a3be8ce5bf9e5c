#include <doctest/doctest.h>
#include <progman/config.hpp>
#include <progman/platform.hpp>

#include "../test_helpers.hpp"

#include <nlohmann/json.hpp>

using namespace progman;

TEST_CASE("parse_config") {
    SUBCASE("reads both keys") {
        auto result = parse_config(R"({"localPath": "/lib", "mirrorPath": "/mirror"})");
        REQUIRE(result.isOk());
        CHECK(result.value().local_path == "/lib");
        CHECK(result.value().mirror_path == "/mirror");
    }

    SUBCASE("missing keys keep defaults") {
        auto result = parse_config(R"({"mirrorPath": "/mirror"})");
        REQUIRE(result.isOk());
        CHECK(result.value().local_path == default_library_path());
        CHECK(result.value().mirror_path == "/mirror");
    }

    SUBCASE("unknown keys and wrong types are ignored") {
        auto result = parse_config(R"({"localPath": 5, "theme": "dark"})");
        REQUIRE(result.isOk());
        CHECK(result.value().local_path == default_library_path());
    }

    SUBCASE("malformed JSON is a parse error") {
        auto result = parse_config("{not json", "/cfg/config.json");
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::PARSE_ERROR);
        CHECK(result.error().message().find("/cfg/config.json") != std::string::npos);
    }

    SUBCASE("non-object JSON is a parse error") {
        auto result = parse_config("[1, 2]");
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::PARSE_ERROR);
    }
}

TEST_CASE("serialize_config uses the front-end key names") {
    AppConfig config;
    config.local_path = "/lib";
    config.mirror_path = "";

    auto j = nlohmann::json::parse(serialize_config(config));
    CHECK(j["localPath"] == "/lib");
    CHECK(j["mirrorPath"] == "");
}

TEST_CASE("load_config and save_config") {
    TempTestDir temp;

    SUBCASE("missing file yields defaults") {
        auto result = load_config(temp.path);
        REQUIRE(result.isOk());
        CHECK(result.value().local_path == default_library_path());
        CHECK(result.value().mirror_path.empty());
    }

    SUBCASE("save then load") {
        std::string dir = temp.file("nested/config");
        AppConfig config;
        config.local_path = temp.file("library");
        config.mirror_path = "/srv/mirror";

        REQUIRE(save_config(dir, config).isOk());

        auto loaded = load_config(dir);
        REQUIRE(loaded.isOk());
        CHECK(loaded.value().local_path == config.local_path);
        CHECK(loaded.value().mirror_path == config.mirror_path);
    }

    SUBCASE("malformed file is reported") {
        write_test_file(temp.file(CONFIG_FILENAME), "{");
        auto result = load_config(temp.path);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::PARSE_ERROR);
    }
}

#ifndef _WIN32
TEST_CASE("resolve_config_dir priority") {
    setenv("PROGMAN_CONFIG_DIR", "/env/progman", 1);

    SUBCASE("explicit override wins") {
        CHECK(resolve_config_dir(std::string("/flag/dir")) == "/flag/dir");
    }

    SUBCASE("environment next") {
        CHECK(resolve_config_dir(std::nullopt) == "/env/progman");
        CHECK(resolve_config_dir(std::string("")) == "/env/progman");
    }

    SUBCASE("XDG_CONFIG_HOME after that") {
        unsetenv("PROGMAN_CONFIG_DIR");
        setenv("XDG_CONFIG_HOME", "/xdg", 1);
        CHECK(resolve_config_dir(std::nullopt) == "/xdg/progman");
        unsetenv("XDG_CONFIG_HOME");
    }

    unsetenv("PROGMAN_CONFIG_DIR");
}

TEST_CASE("default_library_path honours PROGMAN_LIBRARY") {
    setenv("PROGMAN_LIBRARY", "/data/programs", 1);
    CHECK(default_library_path() == "/data/programs");
    CHECK(default_config().local_path == "/data/programs");
    unsetenv("PROGMAN_LIBRARY");
}
#endif
