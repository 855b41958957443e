#include "qbank/app/App.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace {

int runApp(int argc, char** argv) {
    const char* programName = argc > 0 ? argv[0] : "qbank";
    auto options = qbank::app::parseArgs(argc, argv);
    if (!options.has_value()) {
        std::cerr << "Error: " << options.error() << '\n';
        qbank::app::printUsage(std::cerr, programName);
        return 1;
    }
    if (options->showHelp) {
        qbank::app::printUsage(std::cout, programName);
        return 0;
    }

    try {
        qbank::app::App app(std::move(*options), std::cin, std::cout, std::cerr);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv) {
    return runApp(argc, argv);
}
