#include "qbank/store/QuestionStore.hpp"

#include "qbank/common/Log.hpp"
#include "qbank/store/PathResolver.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <ios>
#include <iterator>
#include <system_error>
#include <utility>

using json = nlohmann::json;

namespace qbank::store {
namespace {

constexpr int kJsonIndent = 2;
// Serialization recurses once per level, so deeper documents are rejected at parse time.
constexpr int kMaxNestingDepth = 128;

bool isRegularFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

std::expected<void, StoreError> writeTextFile(const std::filesystem::path& path, std::string_view text,
                                              std::string_view what) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(
            StoreError{StoreErrorKind::FileWrite, std::format("Failed to open '{}' for writing {}", path.string(), what)});
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out.good()) {
        return std::unexpected(
            StoreError{StoreErrorKind::FileWrite, std::format("Failed while writing {} to '{}'", what, path.string())});
    }
    return {};
}

std::expected<std::string, StoreError> readTextFile(const std::filesystem::path& path) {
    if (!isRegularFile(path)) {
        return std::unexpected(
            StoreError{StoreErrorKind::FileRead, std::format("Failed to read file '{}': not a regular file", path.string())});
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            StoreError{StoreErrorKind::FileRead, std::format("Failed to read file '{}'", path.string())});
    }
    std::string contents;
    try {
        contents.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    } catch (const std::ios_base::failure& ex) {
        return std::unexpected(
            StoreError{StoreErrorKind::FileRead, std::format("Failed while reading '{}': {}", path.string(), ex.what())});
    }
    if (in.bad()) {
        return std::unexpected(
            StoreError{StoreErrorKind::FileRead, std::format("Failed while reading '{}'", path.string())});
    }
    return contents;
}

}  // namespace

QuestionStore::QuestionStore(StoreConfig config) : config_(std::move(config)) {}

std::expected<std::filesystem::path, StoreError> QuestionStore::resolvePath() const {
    return resolveQuestionsPath(config_);
}

std::expected<void, StoreError> QuestionStore::ensureInitialized() const {
    auto questionsPath = resolvePath();
    if (!questionsPath.has_value()) {
        return std::unexpected(questionsPath.error());
    }

    std::error_code ec;
    if (std::filesystem::exists(*questionsPath, ec) && !ec) {
        if (isRegularFile(*questionsPath)) {
            return {};
        }
        return std::unexpected(StoreError{
            StoreErrorKind::FileWrite,
            std::format("Cannot create questions file: '{}' exists and is not a regular file", questionsPath->string())});
    }

    if (!config_.resourceDir.empty()) {
        const auto resourcePath = bundledDocumentPath(config_.resourceDir);
        if (std::filesystem::exists(resourcePath, ec) && !ec) {
            std::filesystem::copy_file(resourcePath, *questionsPath, ec);
            if (!ec) {
                common::logInfo(std::format("Copied bundled questions from '{}' to '{}'", resourcePath.string(),
                                            questionsPath->string()));
                return {};
            }
            common::logWarning(std::format("Failed to copy questions from resources '{}': {}", resourcePath.string(),
                                           ec.message()));
        }
    }

    auto written = writeTextFile(*questionsPath, kEmptyQuestionsDocument, "empty questions file");
    if (!written.has_value()) {
        return std::unexpected(written.error());
    }
    common::logInfo(std::format("Created empty questions file '{}'", questionsPath->string()));
    return {};
}

std::expected<std::string, StoreError> QuestionStore::save(std::string_view documentText) const {
    auto questionsPath = resolvePath();
    if (!questionsPath.has_value()) {
        return std::unexpected(questionsPath.error());
    }

    bool tooDeep = false;
    const json::parser_callback_t limitDepth = [&tooDeep](int depth, json::parse_event_t event, json&) {
        if ((event == json::parse_event_t::object_start || event == json::parse_event_t::array_start) &&
            depth >= kMaxNestingDepth) {
            tooDeep = true;
        }
        return !tooDeep;
    };

    json parsed;
    try {
        parsed = json::parse(documentText, limitDepth);
    } catch (const json::parse_error& ex) {
        return std::unexpected(StoreError{StoreErrorKind::JsonParse, std::format("Invalid JSON: {}", ex.what())});
    }
    if (tooDeep) {
        return std::unexpected(StoreError{
            StoreErrorKind::JsonParse,
            std::format("Invalid JSON: nesting exceeds the recursion limit of {} levels", kMaxNestingDepth)});
    }

    std::string pretty;
    try {
        pretty = parsed.dump(kJsonIndent);
    } catch (const json::type_error& ex) {
        return std::unexpected(
            StoreError{StoreErrorKind::JsonParse, std::format("Failed to format JSON: {}", ex.what())});
    }

    auto written = writeTextFile(*questionsPath, pretty, "questions");
    if (!written.has_value()) {
        return std::unexpected(written.error());
    }

    return std::format("Questions saved successfully to \"{}\"", questionsPath->string());
}

std::expected<std::string, StoreError> QuestionStore::read() const {
    if (auto initialized = ensureInitialized(); !initialized.has_value()) {
        return std::unexpected(initialized.error());
    }

    auto questionsPath = resolvePath();
    if (!questionsPath.has_value()) {
        return std::unexpected(questionsPath.error());
    }
    return readTextFile(*questionsPath);
}

std::string QuestionStore::greet(std::string_view name) {
    return std::format("Hello, {}! You've been greeted from qbank!", name);
}

}  // namespace qbank::store
