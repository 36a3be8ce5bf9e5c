/**
 * Unit tests for progman::remove_dir_all
 */

#include <doctest/doctest.h>
#include <progman/remove.hpp>

#include "../test_helpers.hpp"

#include <filesystem>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using progman::ErrorCode;
using progman::remove_dir_all;

TEST_CASE("remove_dir_all removes a directory holding one file") {
    TempTestDir temp;
    std::string target = temp.file("victim");
    write_test_file(target + "/data.txt", "payload");

    auto result = remove_dir_all(target);

    CHECK(result.isOk());
    CHECK_FALSE(fs::exists(target + "/data.txt"));
    CHECK_FALSE(fs::exists(target));
    CHECK(fs::exists(temp.path));
}

TEST_CASE("remove_dir_all removes nested trees") {
    TempTestDir temp;
    std::string target = temp.file("tree");
    write_test_file(target + "/a/b/c/deep.txt");
    write_test_file(target + "/a/side.txt");
    write_test_file(target + "/top.txt");
    fs::create_directories(target + "/empty/dir");

    REQUIRE(remove_dir_all(target).isOk());
    CHECK_FALSE(fs::exists(target));
}

TEST_CASE("remove_dir_all removes an empty directory") {
    TempTestDir temp;
    std::string target = temp.file("empty");
    fs::create_directories(target);

    CHECK(remove_dir_all(target).isOk());
    CHECK_FALSE(fs::exists(target));
}

TEST_CASE("remove_dir_all on a missing path fails without throwing") {
    auto result = remove_dir_all("/nonexistent/path/xyz");

    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::FILE_NOT_FOUND);
    CHECK_FALSE(result.error().message().empty());
    CHECK(result.error().message().find("/nonexistent/path/xyz") != std::string::npos);
}

TEST_CASE("remove_dir_all on the empty string fails and deletes nothing") {
    TempTestDir temp;
    auto old_cwd = fs::current_path();
    write_test_file(temp.file("keep.txt"));
    fs::current_path(temp.path);

    auto result = remove_dir_all("");

    fs::current_path(old_cwd);

    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::FILE_NOT_FOUND);
    CHECK_FALSE(result.error().message().empty());
    CHECK(fs::exists(temp.file("keep.txt")));
}

TEST_CASE("remove_dir_all twice on the same path") {
    TempTestDir temp;
    std::string target = temp.file("twice");
    write_test_file(target + "/f.txt");

    auto first = remove_dir_all(target);
    auto second = remove_dir_all(target);

    CHECK(first.isOk());
    REQUIRE(second.isErr());
    CHECK(second.error().code() == ErrorCode::FILE_NOT_FOUND);
}

TEST_CASE("remove_dir_all rejects a regular file") {
    TempTestDir temp;
    std::string file = temp.file("plain.txt");
    write_test_file(file, "keep me");

    auto result = remove_dir_all(file);

    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::NOT_A_DIRECTORY);
    CHECK(fs::exists(file));
}

#ifndef _WIN32
TEST_CASE("remove_dir_all does not follow symlinks") {
    TempTestDir temp;
    std::string outside = temp.file("outside");
    write_test_file(outside + "/precious.txt");

    SUBCASE("link passed as the path is removed itself") {
        std::string link = temp.file("link");
        fs::create_directory_symlink(outside, link);

        REQUIRE(remove_dir_all(link).isOk());
        CHECK_FALSE(fs::exists(fs::symlink_status(link)));
        CHECK(fs::exists(outside + "/precious.txt"));
    }

    SUBCASE("link inside the tree is unlinked, not traversed") {
        std::string target = temp.file("target");
        write_test_file(target + "/own.txt");
        fs::create_directory_symlink(outside, target + "/escape");

        REQUIRE(remove_dir_all(target).isOk());
        CHECK_FALSE(fs::exists(target));
        CHECK(fs::exists(outside + "/precious.txt"));
    }
}

TEST_CASE("remove_dir_all denied at the root deletes nothing") {
    if (running_as_root()) {
        MESSAGE("skipped: permission checks do not apply to root");
        return;
    }

    TempTestDir temp;
    std::string target = temp.file("locked");
    write_test_file(target + "/inner/file.txt");
    fs::permissions(target, fs::perms::none);

    auto result = remove_dir_all(target);

    fs::permissions(target, fs::perms::owner_all);

    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::PERMISSION_DENIED);
    CHECK(fs::exists(target + "/inner/file.txt"));
}
#endif

TEST_CASE("remove_dir_all runs concurrently on independent trees") {
    TempTestDir temp;
    constexpr int kThreads = 8;

    std::vector<std::string> targets;
    for (int i = 0; i < kThreads; ++i) {
        std::string target = temp.file("t" + std::to_string(i));
        for (int j = 0; j < 10; ++j) {
            write_test_file(target + "/d" + std::to_string(j) + "/f.txt");
        }
        targets.push_back(target);
    }

    std::vector<int> ok(kThreads, 0);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            ok[static_cast<size_t>(i)] = remove_dir_all(targets[static_cast<size_t>(i)]).isOk() ? 1 : 0;
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < kThreads; ++i) {
        CHECK(ok[static_cast<size_t>(i)] == 1);
        CHECK_FALSE(fs::exists(targets[static_cast<size_t>(i)]));
    }
}

TEST_CASE("remove_dir_all racing on the same tree leaves it gone") {
    TempTestDir temp;
    std::string target = temp.file("shared");
    for (int j = 0; j < 50; ++j) {
        write_test_file(target + "/d" + std::to_string(j) + "/f.txt");
    }

    std::thread a([&]() { (void)remove_dir_all(target); });
    std::thread b([&]() { (void)remove_dir_all(target); });
    a.join();
    b.join();

    CHECK_FALSE(fs::exists(target));
}
