#pragma once

#include <string_view>

namespace qbank::common {

/// Enables or disables informational diagnostics. Warnings are always printed.
void setVerboseLogging(bool enabled);

void logInfo(std::string_view message);
void logWarning(std::string_view message);

}  // namespace qbank::common
