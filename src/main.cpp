/// @file main.cpp
/// @brief verinfo application entry point

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "app/app.hpp"
#include "app/command_line.hpp"
#include "core/util/win32_utils.hpp"

/// @brief Console application entry point
int wmain(int argc, wchar_t* argv[]) {
    // Localized labels are written as UTF-8
    SetConsoleOutputCP(CP_UTF8);

    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<size_t>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i) {
        auto arg = verinfo::wideToUtf8(argv[i]);
        if (!arg) {
            std::cerr << "Invalid argument " << i << ": " << verinfo::to_string(arg.error())
                      << '\n';
            return verinfo::app::kExitUsage;
        }
        args.push_back(std::move(*arg));
    }

    // Parse command line
    auto options = verinfo::app::parseCommandLine(args);
    if (!options) {
        std::cerr << options.error() << "\n\n" << verinfo::app::usageText();
        return verinfo::app::kExitUsage;
    }
    if (options->command == verinfo::app::Command::Help) {
        std::cout << verinfo::app::usageText();
        return verinfo::app::kExitSuccess;
    }

    // Initialize and run application
    auto& app = verinfo::app::App::instance();
    if (!app.initialize(*options)) {
        app.shutdown();
        return verinfo::app::kExitFailure;
    }

    int result = app.run();

    app.shutdown();

    return result;
}
