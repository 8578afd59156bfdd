/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Common test helpers for persistence tests
 */

#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <random>
#include <vector>
#include <algorithm>
#include <cstring>

namespace loom::persist::test {

// Create a temporary directory for testing
inline std::string create_temp_dir(const std::string& prefix) {
    std::filesystem::path temp_path = std::filesystem::temp_directory_path();

    // Generate random suffix
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(10000, 99999);

    std::string dir_name = prefix + "_" + std::to_string(dis(gen));
    std::filesystem::path test_dir = temp_path / dir_name;

    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);
    return test_dir.string();
}

// Temp directory removed when the test ends
class TempDir {
public:
    explicit TempDir(const std::string& prefix) : path_(create_temp_dir(prefix)) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return (std::filesystem::path(path_) / name).string(); }

private:
    std::string path_;
};

// Corrupt a file at a specific offset
inline void corrupt_file(const std::string& path, size_t offset, size_t len) {
    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) return;

    file.seekp(offset);
    std::vector<uint8_t> garbage(len, 0xFF);
    file.write(reinterpret_cast<char*>(garbage.data()), len);
}

// Truncate file to simulate torn write
inline void truncate_file(const std::string& path, size_t new_size) {
    std::filesystem::resize_file(path, new_size);
}

inline size_t file_size(const std::string& path) {
    return static_cast<size_t>(std::filesystem::file_size(path));
}

inline std::vector<std::string> files_with_extension(const std::string& dir, const std::string& ext) {
    std::vector<std::string> out;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().extension() == ext) out.push_back(entry.path().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace loom::persist::test
