#pragma once

#include <filesystem>
#include <string>

namespace qbank::common {

/// Simple file logger for diagnosing startup and storage issues.
/// Messages are dropped until init() has opened a log file.
class Logger {
public:
    /// Opens (appending) the given log file. Returns false if it could not be opened.
    static bool init(const std::filesystem::path& logPath);
    static void log(const std::string& message);
    static void logError(const std::string& message);
    static void shutdown();

private:
    Logger() = default;
};

}  // namespace qbank::common
