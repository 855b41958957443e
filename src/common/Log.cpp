#include "qbank/common/Log.hpp"

#include <atomic>
#include <iostream>

namespace qbank::common {
namespace {

std::atomic<bool> verbose{false};

}  // namespace

void setVerboseLogging(bool enabled) {
    verbose.store(enabled);
}

// Diagnostics go to std::clog so stdout only carries command output.
void logInfo(std::string_view message) {
    if (!verbose.load()) {
        return;
    }
    std::clog << "[info] " << message << '\n';
}

void logWarning(std::string_view message) {
    std::clog << "[warn] " << message << '\n';
}

}  // namespace qbank::common
