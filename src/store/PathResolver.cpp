#include "qbank/store/PathResolver.hpp"

#include "qbank/common/Log.hpp"

#include <format>
#include <system_error>

namespace qbank::store {
namespace {

bool fileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec;
}

}  // namespace

std::filesystem::path developmentDocumentPath(const std::filesystem::path& root) {
    return root / "src" / "data" / kQuestionsFilename;
}

std::filesystem::path bundledDocumentPath(const std::filesystem::path& resourceDir) {
    return resourceDir / "data" / kQuestionsFilename;
}

std::expected<std::filesystem::path, StoreError> resolveQuestionsPath(const StoreConfig& config) {
    if (!config.cwd.empty()) {
        auto candidate = developmentDocumentPath(config.cwd);
        if (fileExists(candidate)) {
            return candidate;
        }
    }

    // Launched from a nested build or work directory.
    if (!config.parentDir.empty()) {
        auto candidate = developmentDocumentPath(config.parentDir);
        if (fileExists(candidate)) {
            return candidate;
        }
    }

    if (config.perUserDataDir.empty()) {
        return std::unexpected(StoreError{StoreErrorKind::PathResolution,
                                          "Failed to get app data dir: no per-user data directory available"});
    }

    std::error_code ec;
    if (!std::filesystem::exists(config.perUserDataDir, ec)) {
        ec.clear();
        std::filesystem::create_directories(config.perUserDataDir, ec);
        if (ec) {
            return std::unexpected(StoreError{
                StoreErrorKind::DirectoryCreate,
                std::format("Failed to create app data dir '{}': {}", config.perUserDataDir.string(), ec.message())});
        }
        common::logInfo(std::format("Created app data dir '{}'", config.perUserDataDir.string()));
    } else if (ec) {
        return std::unexpected(StoreError{
            StoreErrorKind::PathResolution,
            std::format("Failed to inspect app data dir '{}': {}", config.perUserDataDir.string(), ec.message())});
    }

    return config.perUserDataDir / kQuestionsFilename;
}

}  // namespace qbank::store
