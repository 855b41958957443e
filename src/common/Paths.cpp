#include "qbank/common/Paths.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <Windows.h>
#else
#include <unistd.h>

#include <climits>
#endif

namespace qbank::common {
namespace {

constexpr const char* kAppDirName = "qbank";

#ifdef _WIN32
std::filesystem::path getExecutablePath() {
    wchar_t buf[MAX_PATH];
    const DWORD len = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    if (len == 0 || len >= MAX_PATH) {
        return {};
    }
    return std::filesystem::path(buf);
}
#else
std::filesystem::path getExecutablePath() {
    char buf[PATH_MAX];
    const ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}
#endif

/// Returns the value of an environment variable, or nullptr when unset or empty.
const char* nonEmptyEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return nullptr;
    }
    return value;
}

}  // namespace

std::filesystem::path executableDir() {
    static const std::filesystem::path dir = getExecutablePath().parent_path();
    return dir;
}

std::filesystem::path bundledResourceDir() {
#ifndef _WIN32
    if (const char* appDir = nonEmptyEnv("APPDIR"); appDir != nullptr) {
        auto candidate = std::filesystem::path(appDir) / "usr" / "share" / kAppDirName;
        std::error_code ec;
        if (std::filesystem::is_directory(candidate, ec) && !ec) {
            return candidate;
        }
    }
#endif
    return executableDir();
}

std::filesystem::path userDataDir() {
#if defined(_WIN32)
    if (const char* appData = nonEmptyEnv("APPDATA"); appData != nullptr) {
        return std::filesystem::path(appData) / kAppDirName;
    }
    return {};
#elif defined(__APPLE__)
    if (const char* home = nonEmptyEnv("HOME"); home != nullptr) {
        return std::filesystem::path(home) / "Library" / "Application Support" / kAppDirName;
    }
    return {};
#else
    if (const char* xdg = nonEmptyEnv("XDG_DATA_HOME"); xdg != nullptr) {
        return std::filesystem::path(xdg) / kAppDirName;
    }
    if (const char* home = nonEmptyEnv("HOME"); home != nullptr) {
        return std::filesystem::path(home) / ".local" / "share" / kAppDirName;
    }
    return {};
#endif
}

}  // namespace qbank::common
