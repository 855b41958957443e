#pragma once

#include "qbank/store/StoreConfig.hpp"
#include "qbank/store/StoreError.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace qbank::store {

/// Contents written when neither an existing document nor a bundled default is available.
inline constexpr std::string_view kEmptyQuestionsDocument = R"({
    "questions": [],
    "version": "1.0.0",
    "lastUpdated": ""
})";

/// Persists the questions document at the location chosen by resolveQuestionsPath().
/// The path is re-resolved on every call. No locking is done around the file.
class QuestionStore {
public:
    explicit QuestionStore(StoreConfig config);

    const StoreConfig& config() const { return config_; }

    std::expected<std::filesystem::path, StoreError> resolvePath() const;

    /// Puts a document in place if none exists: copies the bundled default, else writes
    /// kEmptyQuestionsDocument. A missing bundled default is not an error.
    std::expected<void, StoreError> ensureInitialized() const;

    /// Validates documentText as JSON and overwrites the document with a pretty-printed copy.
    /// Invalid JSON leaves the existing file untouched. Returns a confirmation naming the path.
    std::expected<std::string, StoreError> save(std::string_view documentText) const;

    /// Returns the document bytes exactly as stored. Contents are not re-validated.
    std::expected<std::string, StoreError> read() const;

    static std::string greet(std::string_view name);

private:
    StoreConfig config_;
};

}  // namespace qbank::store
