#include "qbank/app/App.hpp"

#include "qbank/common/Log.hpp"
#include "qbank/common/Logger.hpp"
#include "qbank/store/CommandHandler.hpp"
#include "qbank/store/StoreConfig.hpp"

#include <format>
#include <fstream>
#include <ios>
#include <istream>
#include <iterator>
#include <ostream>
#include <system_error>
#include <utility>

namespace qbank::app {
namespace {

std::expected<std::string, std::string> readStream(std::istream& in, std::string_view label) {
    std::string text;
    try {
        text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    } catch (const std::ios_base::failure& ex) {
        return std::unexpected(std::format("Failed while reading {}: {}", label, ex.what()));
    }
    if (in.bad()) {
        return std::unexpected(std::format("Failed while reading {}", label));
    }
    return text;
}

std::expected<std::string, std::string> readInput(const std::optional<std::filesystem::path>& inputPath,
                                                  std::istream& in) {
    if (!inputPath.has_value()) {
        return readStream(in, "standard input");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(*inputPath, ec) || ec) {
        return std::unexpected(std::format("Failed to open input '{}': not a regular file", inputPath->string()));
    }
    std::ifstream file(*inputPath, std::ios::binary);
    if (!file) {
        return std::unexpected(std::format("Failed to open input '{}'", inputPath->string()));
    }
    return readStream(file, std::format("input '{}'", inputPath->string()));
}

store::StoreConfig buildConfig(const AppOptions& options) {
    auto config = store::StoreConfig::fromEnvironment();
    if (options.cwdOverride.has_value()) {
        config.setWorkingDirectory(*options.cwdOverride);
    }
    if (options.dataDirOverride.has_value()) {
        config.perUserDataDir = *options.dataDirOverride;
    }
    if (options.resourceDirOverride.has_value()) {
        config.resourceDir = *options.resourceDirOverride;
    }
    return config;
}

}  // namespace

void printUsage(std::ostream& out, std::string_view programName) {
    out << "Usage:\n";
    out << "  " << programName << " [options] greet <name>\n";
    out << "  " << programName << " [options] save [<file.json>|-]\n";
    out << "  " << programName << " [options] read\n";
    out << "  " << programName << " [options] path\n";
    out << "\nCommands:\n";
    out << "  greet           Print a greeting for <name>\n";
    out << "  save            Validate and store a questions document (stdin when no file is given)\n";
    out << "  read            Print the stored questions document, creating it if needed\n";
    out << "  path            Print the resolved questions document path\n";
    out << "\nOptions:\n";
    out << "  --cwd           Directory searched for src/data/questions.json (default: current directory)\n";
    out << "  --data-dir      Per-user data directory override\n";
    out << "  --resource-dir  Directory containing the bundled data/questions.json\n";
    out << "  --log-file      Append diagnostics to this file\n";
    out << "  --verbose, -v   Print informational diagnostics to stderr\n";
    out << "  --help, -h      Show this help\n";
}

std::expected<AppOptions, std::string> parseArgs(const std::vector<std::string>& args) {
    AppOptions options;
    std::vector<std::string> positional;

    auto require_value = [&](size_t& index, std::string_view flag) -> std::expected<std::string, std::string> {
        if (index + 1 >= args.size()) {
            return std::unexpected(std::format("Missing value for {}", flag));
        }
        ++index;
        return args[index];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
            return options;
        }
        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
            continue;
        }
        if (arg == "--cwd" || arg == "--data-dir" || arg == "--resource-dir" || arg == "--log-file") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            if (value->empty()) {
                return std::unexpected(std::format("Empty value for {}", arg));
            }
            const std::filesystem::path path(*value);
            if (arg == "--cwd") {
                options.cwdOverride = path;
            } else if (arg == "--data-dir") {
                options.dataDirOverride = path;
            } else if (arg == "--resource-dir") {
                options.resourceDirOverride = path;
            } else {
                options.logFile = path;
            }
            continue;
        }
        if (arg.size() > 1 && arg.starts_with("-")) {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
        positional.emplace_back(arg);
    }

    if (positional.empty()) {
        return std::unexpected("Missing command");
    }

    const std::string& command = positional.front();
    const size_t argCount = positional.size() - 1;
    if (command == "greet") {
        if (argCount != 1) {
            return std::unexpected("greet expects exactly one <name>");
        }
        options.command = AppCommand::Greet;
        options.greetName = positional[1];
    } else if (command == "save") {
        if (argCount > 1) {
            return std::unexpected("save expects at most one input file");
        }
        options.command = AppCommand::Save;
        if (argCount == 1 && positional[1] != "-") {
            options.inputPath = std::filesystem::path(positional[1]);
        }
    } else if (command == "read" || command == "path") {
        if (argCount != 0) {
            return std::unexpected(std::format("{} takes no arguments", command));
        }
        options.command = (command == "read") ? AppCommand::Read : AppCommand::Path;
    } else {
        return std::unexpected(std::format("Unknown command '{}'", command));
    }

    return options;
}

std::expected<AppOptions, std::string> parseArgs(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseArgs(args);
}

App::App(AppOptions options, std::istream& in, std::ostream& out, std::ostream& err)
    : options_(std::move(options)), in_(in), out_(out), err_(err) {}

int App::run() {
    common::setVerboseLogging(options_.verbose);
    if (options_.logFile.has_value() && !common::Logger::init(*options_.logFile)) {
        common::logWarning(std::format("Could not open log file '{}'", options_.logFile->string()));
    }
    common::Logger::log("Starting qbank...");

    const int exitCode = dispatch();

    common::Logger::log(std::format("Exiting with status {}", exitCode));
    common::Logger::shutdown();
    return exitCode;
}

int App::dispatch() {
    store::QuestionCommands commands(buildConfig(options_));

    // A failed startup initialization must not prevent the command from running.
    if (auto initialized = commands.store().ensureInitialized(); !initialized.has_value()) {
        const auto message = std::format("Failed to initialize questions: {}", initialized.error().message);
        common::logWarning(message);
        common::Logger::logError(message);
    }

    auto fail = [&](std::string_view message) {
        err_ << "Error: " << message << '\n';
        common::Logger::logError(std::string(message));
        return 1;
    };

    switch (options_.command) {
    case AppCommand::Greet:
        out_ << commands.greet(options_.greetName) << '\n';
        return 0;
    case AppCommand::Save: {
        auto input = readInput(options_.inputPath, in_);
        if (!input.has_value()) {
            return fail(input.error());
        }
        auto saved = commands.saveQuestions(*input);
        if (!saved.has_value()) {
            return fail(saved.error().message);
        }
        common::Logger::log(*saved);
        out_ << *saved << '\n';
        return 0;
    }
    case AppCommand::Read: {
        auto contents = commands.readQuestions();
        if (!contents.has_value()) {
            return fail(contents.error().message);
        }
        out_ << *contents;
        out_.flush();
        return 0;
    }
    case AppCommand::Path: {
        auto path = commands.store().resolvePath();
        if (!path.has_value()) {
            return fail(path.error().message);
        }
        out_ << path->string() << '\n';
        return 0;
    }
    }
    return fail("Unknown command");
}

}  // namespace qbank::app
