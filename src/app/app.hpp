/// @file app.hpp
/// @brief Main application class

#pragma once

#include <filesystem>
#include <iosfwd>

#include "command_line.hpp"
#include "core/config/settings.hpp"

namespace verinfo::app {

/// @brief Process exit codes
enum ExitCode : int {
    kExitSuccess = 0,
    kExitFailure = 1,
    kExitUsage = 2,
};

/// @brief Main application class
///
/// Loads settings, sets up logging and string tables, then runs the command
/// selected on the command line.
class App {
public:
    /// @brief Get singleton instance
    [[nodiscard]] static App& instance();

    /// @brief Initialize application
    /// @param options Parsed command line
    /// @return true if initialization succeeded
    bool initialize(const Options& options);

    /// @brief Run the selected command
    /// @return Exit code
    int run();

    /// @brief Shutdown application
    void shutdown();

private:
    App() = default;
    ~App() = default;

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    void initializeLogging();
    void initializeI18n();
    void compareOnStartup();

    int runReport(std::ostream& out);
    int runLanguages(std::ostream& out);
    int runCompare(std::ostream& out);
    int runRegistry(std::ostream& out);
    int runCim(std::ostream& out);
    int runEnv(std::ostream& out);
    int runFolder(std::ostream& out);

    Options options_;
    config::Settings settings_;
    bool initialized_ = false;
};

/// @brief Resolve a settings path against the executable directory
[[nodiscard]] std::filesystem::path resolveAgainstExecutable(const std::filesystem::path& path);

}  // namespace verinfo::app
