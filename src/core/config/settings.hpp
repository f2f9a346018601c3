/// @file settings.hpp
/// @brief Application settings structure definitions

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace verinfo::config {

/// @brief Reaction to a string resource that is missing at runtime
enum class MissingResourcePolicy {
    Auto,         // Throw under a debugger, placeholder text otherwise
    Throw,        // Always throw
    Placeholder,  // Always log and show placeholder text
};

/// @brief Get string representation of MissingResourcePolicy
[[nodiscard]] constexpr std::string_view to_string(MissingResourcePolicy policy) noexcept {
    switch (policy) {
    case MissingResourcePolicy::Auto:
        return "auto";
    case MissingResourcePolicy::Throw:
        return "throw";
    case MissingResourcePolicy::Placeholder:
        return "placeholder";
    }
    return "auto";
}

/// @brief Parse MissingResourcePolicy from string
[[nodiscard]] constexpr MissingResourcePolicy
missingResourcePolicyFromString(std::string_view str) noexcept {
    if (str == "throw")
        return MissingResourcePolicy::Throw;
    if (str == "placeholder")
        return MissingResourcePolicy::Placeholder;
    return MissingResourcePolicy::Auto;
}

/// @brief Language settings
struct LanguageSettings {
    // "auto" = system detection, or explicit culture tag like "de-DE"
    std::string language = "auto";
    std::string default_culture = "en-US";
    // Relative paths resolve against the executable directory
    std::filesystem::path directory = "Languages";
    // Log key differences between the default and current culture at startup
    bool compare_on_startup = true;
};

/// @brief Logging settings
struct LogSettings {
    std::string level = "info";  // trace|debug|info|warn|error|critical|off
    bool console = false;
    std::filesystem::path file;  // Empty = %LOCALAPPDATA%/verinfo/verinfo.log
};

/// @brief Application settings
struct Settings {
    LanguageSettings language;
    LogSettings logging;
    MissingResourcePolicy missing_resources = MissingResourcePolicy::Auto;

    /// @brief Get default settings
    [[nodiscard]] static Settings defaults() { return Settings{}; }
};

}  // namespace verinfo::config
