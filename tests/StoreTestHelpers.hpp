#pragma once

#include "qbank/store/StoreConfig.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace qbank::test_helpers {

/// Creates a unique directory under the system temp dir and removes it on destruction.
class ScopedTempDir {
public:
    explicit ScopedTempDir(std::string_view stem) {
        const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() / std::format("qbank-{}-{}", stem, tick);
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

class ScopedEnvVar {
public:
    ScopedEnvVar(std::string name, const std::optional<std::string>& value) : name_(std::move(name)) {
        if (const char* existing = std::getenv(name_.c_str()); existing != nullptr) {
            originalValue_ = std::string(existing);
        }
        apply(value);
    }

    ~ScopedEnvVar() { apply(originalValue_); }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

private:
    void apply(const std::optional<std::string>& value) {
#ifdef _WIN32
        _putenv_s(name_.c_str(), value.has_value() ? value->c_str() : "");
#else
        if (value.has_value()) {
            setenv(name_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
#endif
    }

    std::string name_;
    std::optional<std::string> originalValue_;
};

inline void writeFile(const std::filesystem::path& path, std::string_view contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/// Config rooted in a temp dir: <root>/work/nested as cwd, <root>/work as parent,
/// <root>/userdata as the per-user data dir and <root>/resources as the resource dir.
inline store::StoreConfig isolatedConfig(const std::filesystem::path& root) {
    store::StoreConfig config;
    const auto work = root / "work" / "nested";
    std::filesystem::create_directories(work);
    config.setWorkingDirectory(work);
    config.perUserDataDir = root / "userdata";
    config.resourceDir = root / "resources";
    return config;
}

}  // namespace qbank::test_helpers
