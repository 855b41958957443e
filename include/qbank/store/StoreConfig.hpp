#pragma once

#include <filesystem>

namespace qbank::store {

/// Filesystem inputs for locating the questions document.
/// Any field may be empty; an empty parentDir or resourceDir simply skips that lookup.
struct StoreConfig {
    std::filesystem::path cwd;
    std::filesystem::path parentDir;
    std::filesystem::path perUserDataDir;
    std::filesystem::path resourceDir;

    /// Builds the configuration from the process working directory and the platform
    /// data/resource locations in common/Paths.
    static StoreConfig fromEnvironment();

    /// Replaces cwd and recomputes parentDir from it.
    void setWorkingDirectory(const std::filesystem::path& dir);
};

}  // namespace qbank::store
