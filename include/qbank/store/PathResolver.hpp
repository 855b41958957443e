#pragma once

#include "qbank/store/StoreConfig.hpp"
#include "qbank/store/StoreError.hpp"

#include <expected>
#include <filesystem>

namespace qbank::store {

inline constexpr const char* kQuestionsFilename = "questions.json";

/// Development-tree location of the document, relative to a project root.
std::filesystem::path developmentDocumentPath(const std::filesystem::path& root);

/// Bundled default document inside the resource directory.
std::filesystem::path bundledDocumentPath(const std::filesystem::path& resourceDir);

/// Resolves the questions document path.
/// Search order: <cwd>/src/data/questions.json -> <parentDir>/src/data/questions.json ->
/// <perUserDataDir>/questions.json. Only the last branch has a side effect: it creates
/// perUserDataDir when missing. The result is never cached.
std::expected<std::filesystem::path, StoreError> resolveQuestionsPath(const StoreConfig& config);

}  // namespace qbank::store
