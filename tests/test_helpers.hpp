/**
 * Shared helpers for progman tests
 */

#pragma once

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#ifndef _WIN32
#include <unistd.h>
#endif

// Helper to create a unique temporary directory, removed on destruction
class TempTestDir {
public:
    TempTestDir() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        std::string unique_name = "progman_test_" + std::to_string(rd()) + "_" +
                                  std::to_string(counter++);
        path = (std::filesystem::temp_directory_path() / unique_name).generic_string();
        std::filesystem::create_directories(path);
    }

    ~TempTestDir() {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    }

    TempTestDir(const TempTestDir&) = delete;
    TempTestDir& operator=(const TempTestDir&) = delete;

    std::string file(const std::string& rel) const { return path + "/" + rel; }

    std::string path;
};

inline void write_test_file(const std::string& path, const std::string& content = "x") {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream(path) << content;
}

// Permission checks are meaningless when running as root
inline bool running_as_root() {
#ifdef _WIN32
    return false;
#else
    return geteuid() == 0;
#endif
}
