#include "qbank/store/StoreError.hpp"

namespace qbank::store {

std::string_view storeErrorKindName(StoreErrorKind kind) {
    switch (kind) {
    case StoreErrorKind::PathResolution:
        return "path_resolution";
    case StoreErrorKind::DirectoryCreate:
        return "directory_create";
    case StoreErrorKind::JsonParse:
        return "json_parse";
    case StoreErrorKind::FileWrite:
        return "file_write";
    case StoreErrorKind::FileRead:
        return "file_read";
    }
    return "unknown";
}

}  // namespace qbank::store
