#include "qbank/store/CommandHandler.hpp"

#include "qbank/common/Log.hpp"

#include <format>
#include <utility>

namespace qbank::store {

QuestionCommands::QuestionCommands(StoreConfig config) : store_(std::move(config)) {}

std::string QuestionCommands::greet(std::string_view name) {
    return QuestionStore::greet(name);
}

std::expected<std::string, StoreError> QuestionCommands::saveQuestions(std::string_view questionsJson) {
    common::logInfo(std::format("save_questions: {} bytes", questionsJson.size()));
    return store_.save(questionsJson);
}

std::expected<std::string, StoreError> QuestionCommands::readQuestions() {
    common::logInfo("read_questions");
    return store_.read();
}

}  // namespace qbank::store
