#include "qbank/store/StoreConfig.hpp"

#include "qbank/common/Paths.hpp"

#include <system_error>

namespace qbank::store {

StoreConfig StoreConfig::fromEnvironment() {
    StoreConfig config;

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        config.setWorkingDirectory(cwd);
    }

    config.perUserDataDir = common::userDataDir();
    config.resourceDir = common::bundledResourceDir();
    return config;
}

void StoreConfig::setWorkingDirectory(const std::filesystem::path& dir) {
    cwd = dir;
    parentDir.clear();
    if (dir.empty()) {
        return;
    }

    // "/a/b/" names the same directory as "/a/b".
    auto base = dir;
    if (!base.has_filename() && base.has_relative_path()) {
        base = base.parent_path();
    }
    auto parent = base.parent_path();
    if (!parent.empty() && parent != base) {
        parentDir = parent;
    }
}

}  // namespace qbank::store
