// Filesystem and environment helpers shared by the Catch2 suites

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

namespace valvec::test {

// Unique temporary directory removed on destruction
class TempDir {
public:
    explicit TempDir(std::string_view prefix = "valvec_test_") {
        namespace fs = std::filesystem;
        thread_local std::mt19937_64 rng{std::random_device{}()};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                (std::string(prefix) + std::to_string(stamp) + "_" + std::to_string(rng() % 100000));
        fs::create_directories(path_);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

    // Write `data` to `name` inside the directory and return the full path
    std::filesystem::path write(const std::string& name, std::string_view data) const {
        auto file = path_ / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        return file;
    }

private:
    std::filesystem::path path_;
};

// Sets (or unsets, for nullopt) an environment variable and restores it on scope exit
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, std::optional<std::string> value) : key_(std::move(key)) {
        if (const char* prev = std::getenv(key_.c_str())) {
            previous_ = prev;
        }
        apply(value);
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

    ~ScopedEnvVar() { apply(previous_); }

private:
    void apply(const std::optional<std::string>& value) const {
        if (value) {
            ::setenv(key_.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(key_.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> previous_;
};

} // namespace valvec::test
