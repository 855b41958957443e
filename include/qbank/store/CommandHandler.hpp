#pragma once

#include "qbank/store/QuestionStore.hpp"
#include "qbank/store/StoreError.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace qbank::store {

/// The commands a front end can invoke. Any transport (CLI, RPC, direct call) binds to this.
class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    virtual std::string greet(std::string_view name) = 0;
    virtual std::expected<std::string, StoreError> saveQuestions(std::string_view questionsJson) = 0;
    virtual std::expected<std::string, StoreError> readQuestions() = 0;
};

/// CommandHandler backed by a QuestionStore.
class QuestionCommands : public CommandHandler {
public:
    explicit QuestionCommands(StoreConfig config);

    std::string greet(std::string_view name) override;
    std::expected<std::string, StoreError> saveQuestions(std::string_view questionsJson) override;
    std::expected<std::string, StoreError> readQuestions() override;

    const QuestionStore& store() const { return store_; }

private:
    QuestionStore store_;
};

}  // namespace qbank::store
