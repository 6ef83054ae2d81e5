/**
 * @file test_helpers.hpp
 * @brief RAII helpers shared by the filesystem and environment tests
 */

#ifndef GRAFT_TEST_HELPERS_HPP
#define GRAFT_TEST_HELPERS_HPP

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace graft::test {

/**
 * @brief Temporary file removed on destruction
 */
class TempFile {
public:
    explicit TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(std::filesystem::temp_directory_path() /
                ("graft_test_" + std::to_string(std::random_device{}()) + extension)) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

/**
 * @brief Sets an environment variable and restores the previous state
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(const std::string& name, const std::string& value) : name_(name) {
        if (const char* original = std::getenv(name.c_str())) {
            had_original_ = true;
            original_value_ = original;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~ScopedEnvVar() {
        if (had_original_) {
            setenv(name_.c_str(), original_value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

private:
    std::string name_;
    bool had_original_ = false;
    std::string original_value_;
};

} // namespace graft::test

#endif // GRAFT_TEST_HELPERS_HPP
