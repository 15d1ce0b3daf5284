// Shared helpers for the Catch2 suites

#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <system_error>

namespace ranklab::test {

/**
 * @brief Scratch directory under the system temp dir, removed on scope exit.
 */
class TempDir {
public:
    explicit TempDir(std::string_view prefix = "ranklab_test_") {
        namespace fs = std::filesystem;
        std::uniform_int_distribution<int> dist(0, 9999);
        thread_local std::mt19937_64 rng{std::random_device{}()};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                (std::string(prefix) + std::to_string(stamp) + "_" + std::to_string(dist(rng)));
        fs::create_directories(path_);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

    /// Write data to name inside the directory and return the full path.
    std::filesystem::path write(const std::string& name, std::string_view data) const {
        const auto file = path_ / name;
        std::ofstream stream(file, std::ios::binary);
        stream.write(data.data(), static_cast<std::streamsize>(data.size()));
        return file;
    }

private:
    std::filesystem::path path_;
};

/**
 * @brief RAII helper to set an environment variable and restore it on scope exit.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, std::optional<std::string> value)
        : key_(std::move(key)), previous_(get_env(key_)) {
        set_env(key_, std::move(value));
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

    ~ScopedEnvVar() { set_env(key_, previous_); }

private:
    static std::optional<std::string> get_env(const std::string& key) {
        if (const auto* value = std::getenv(key.c_str()); value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    }

    static void set_env(const std::string& key, const std::optional<std::string>& value) {
#ifdef _WIN32
        _putenv_s(key.c_str(), value ? value->c_str() : "");
#else
        if (value) {
            ::setenv(key.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(key.c_str());
        }
#endif
    }

    std::string key_;
    std::optional<std::string> previous_;
};

} // namespace ranklab::test
