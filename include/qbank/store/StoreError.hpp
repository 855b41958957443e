#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace qbank::store {

enum class StoreErrorKind : uint8_t {
    PathResolution,
    DirectoryCreate,
    JsonParse,
    FileWrite,
    FileRead,
};

struct StoreError {
    StoreError(StoreErrorKind errorKind, std::string errorMessage)
        : kind(errorKind), message(std::move(errorMessage)) {}

    StoreErrorKind kind;
    std::string message;
};

[[nodiscard]] std::string_view storeErrorKindName(StoreErrorKind kind);

}  // namespace qbank::store
