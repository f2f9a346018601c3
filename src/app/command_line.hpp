/// @file command_line.hpp
/// @brief Console command line parsing

#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace verinfo::app {

/// @brief Report sections that can be printed
enum class Section {
    All,
    OperatingSystem,
    Hardware,
    Environment,
};

/// @brief Parse a section name ("all", "os", "hardware", "environment")
[[nodiscard]] std::optional<Section> sectionFromString(std::string_view str) noexcept;

/// @brief What the program was asked to do
enum class Command {
    Report,     // Print report sections
    Languages,  // Translation coverage of every culture
    Compare,    // Key comparison against the default culture
    Registry,   // Single registry value
    Cim,        // Single CIM property
    Env,        // Single environment variable
    Folder,     // Single special folder
    Help,
};

/// @brief Parsed command line
struct Options {
    Command command = Command::Report;
    Section section = Section::All;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> language;  // Overrides the settings file
    bool verbose = false;                 // Debug logging to the console
    std::string argument;                 // Value name / property / variable / folder / culture
    std::string cim_class;                // For Command::Cim ("os", "sys", "proc")
};

/// @brief Parse arguments (excluding the program name)
/// @return Options, or an error message describing the offending argument
[[nodiscard]] std::expected<Options, std::string> parseCommandLine(
    const std::vector<std::string>& args);

/// @brief Usage text printed for --help and on parse errors
[[nodiscard]] std::string usageText();

}  // namespace verinfo::app
