#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qbank::app {

enum class AppCommand : uint8_t {
    Greet,
    Save,
    Read,
    Path,
};

struct AppOptions {
    AppCommand command = AppCommand::Read;
    std::string greetName;
    /// Input document for save; stdin when unset.
    std::optional<std::filesystem::path> inputPath;
    std::optional<std::filesystem::path> cwdOverride;
    std::optional<std::filesystem::path> dataDirOverride;
    std::optional<std::filesystem::path> resourceDirOverride;
    std::optional<std::filesystem::path> logFile;
    bool verbose = false;
    bool showHelp = false;
};

void printUsage(std::ostream& out, std::string_view programName);

/// Parses command-line arguments, excluding the program name.
std::expected<AppOptions, std::string> parseArgs(const std::vector<std::string>& args);
std::expected<AppOptions, std::string> parseArgs(int argc, char** argv);

class App {
public:
    App(AppOptions options, std::istream& in, std::ostream& out, std::ostream& err);

    /// Runs startup initialization and the selected command. Returns the process exit code.
    int run();

private:
    int dispatch();

    AppOptions options_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
};

}  // namespace qbank::app
