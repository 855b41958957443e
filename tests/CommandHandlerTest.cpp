#include "qbank/store/CommandHandler.hpp"
#include "StoreTestHelpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <type_traits>

namespace qbank::store {
namespace {
using json = nlohmann::json;

using test_helpers::isolatedConfig;
using test_helpers::ScopedTempDir;

TEST(CommandHandlerTest, GreetNeverTouchesFilesystem) {
    ScopedTempDir temp("cmd-greet");
    auto config = isolatedConfig(temp.path());
    std::unique_ptr<CommandHandler> handler = std::make_unique<QuestionCommands>(config);

    EXPECT_EQ(handler->greet("World"), "Hello, World! You've been greeted from qbank!");
    EXPECT_FALSE(std::filesystem::exists(config.perUserDataDir));
}

TEST(CommandHandlerTest, SaveAndReadThroughInterface) {
    ScopedTempDir temp("cmd-roundtrip");
    std::unique_ptr<CommandHandler> handler = std::make_unique<QuestionCommands>(isolatedConfig(temp.path()));

    const std::string document = R"({"questions":[{"id":"n1","question":"Port for HTTPS?","answer":443}],)"
                                 R"("version":"1.0.0","lastUpdated":"2025-06-01T00:00:00Z"})";
    auto saved = handler->saveQuestions(document);
    ASSERT_TRUE(saved.has_value()) << saved.error().message;
    EXPECT_NE(saved->find("questions.json"), std::string::npos);

    auto contents = handler->readQuestions();
    ASSERT_TRUE(contents.has_value()) << contents.error().message;
    EXPECT_EQ(json::parse(*contents), json::parse(document));
}

TEST(CommandHandlerTest, SaveRejectsMalformedJson) {
    ScopedTempDir temp("cmd-invalid");
    QuestionCommands handler(isolatedConfig(temp.path()));

    auto saved = handler.saveQuestions("[1, 2,");
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().kind, StoreErrorKind::JsonParse);
    EXPECT_EQ(storeErrorKindName(saved.error().kind), "json_parse");
}

static_assert(!std::is_default_constructible_v<StoreError>, "StoreError needs an explicit kind");

TEST(CommandHandlerTest, StoreErrorKeepsKindAndMessage) {
    const StoreError error(StoreErrorKind::DirectoryCreate, "Failed to create app data dir");
    EXPECT_EQ(error.kind, StoreErrorKind::DirectoryCreate);
    EXPECT_EQ(error.message, "Failed to create app data dir");
}

TEST(CommandHandlerTest, ErrorKindNamesAreDistinct) {
    EXPECT_EQ(storeErrorKindName(StoreErrorKind::PathResolution), "path_resolution");
    EXPECT_EQ(storeErrorKindName(StoreErrorKind::DirectoryCreate), "directory_create");
    EXPECT_EQ(storeErrorKindName(StoreErrorKind::FileWrite), "file_write");
    EXPECT_EQ(storeErrorKindName(StoreErrorKind::FileRead), "file_read");
}

}  // namespace
}  // namespace qbank::store
