#include "qbank/common/Paths.hpp"
#include "qbank/store/StoreConfig.hpp"
#include "StoreTestHelpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace qbank::store {
namespace {

using test_helpers::ScopedEnvVar;
using test_helpers::ScopedTempDir;

TEST(StoreConfigTest, WorkingDirectoryDerivesParent) {
    StoreConfig config;
    config.setWorkingDirectory(std::filesystem::path("/home/user/project/build"));
    EXPECT_EQ(config.cwd, std::filesystem::path("/home/user/project/build"));
    EXPECT_EQ(config.parentDir, std::filesystem::path("/home/user/project"));
}

TEST(StoreConfigTest, TrailingSeparatorDoesNotChangeParent) {
    StoreConfig config;
    config.setWorkingDirectory(std::filesystem::path("/home/user/project/build/"));
    EXPECT_EQ(config.parentDir, std::filesystem::path("/home/user/project"));
}

TEST(StoreConfigTest, RootHasNoParent) {
    StoreConfig config;
    config.parentDir = "/stale";
    config.setWorkingDirectory(std::filesystem::path("/"));
    EXPECT_TRUE(config.parentDir.empty());
}

#if !defined(_WIN32) && !defined(__APPLE__)

TEST(StoreConfigTest, FromEnvironmentUsesCurrentDirectoryAndDataDir) {
    ScopedTempDir temp("config-env");
    const ScopedEnvVar xdg("XDG_DATA_HOME", temp.path().string());

    const auto config = StoreConfig::fromEnvironment();
    EXPECT_EQ(config.cwd, std::filesystem::current_path());
    EXPECT_EQ(config.perUserDataDir, temp.path() / "qbank");
    EXPECT_EQ(config.resourceDir, common::bundledResourceDir());
}

#endif

}  // namespace
}  // namespace qbank::store
