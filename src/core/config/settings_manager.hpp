/// @file settings_manager.hpp
/// @brief settings.toml loading, saving and validation

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "core/util/result.hpp"
#include "settings.hpp"

namespace verinfo::config {

/// @brief Why a settings file could not be used
enum class ConfigError {
    FileNotFound,
    ParseError,
    IoError,
};

[[nodiscard]] constexpr std::string_view to_string(ConfigError error) noexcept {
    switch (error) {
    case ConfigError::FileNotFound:
        return "Settings file not found";
    case ConfigError::ParseError:
        return "Settings file is not valid TOML";
    case ConfigError::IoError:
        return "Cannot write settings file";
    }
    return "Unknown settings error";
}

/// @brief Outcome of SettingsManager::validate()
///
/// Errors make the settings unusable; warnings are only logged.
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

/// @brief Reads and writes the [language], [logging] and [resources] tables
class SettingsManager {
public:
    /// @brief Path used when no --config is given:
    /// %LOCALAPPDATA%/verinfo/settings.toml on Windows, ./settings.toml elsewhere
    [[nodiscard]] static std::filesystem::path defaultPath();

    /// @brief Load a settings file. Missing tables and keys keep their defaults.
    [[nodiscard]] static Result<Settings, ConfigError> loadFrom(const std::filesystem::path& path);

    /// @brief loadFrom(path), falling back to Settings::defaults()
    /// @param warning Set when the file exists but cannot be used, left empty otherwise.
    /// Callers log it again once file logging is up.
    [[nodiscard]] static Settings loadOrDefault(const std::filesystem::path& path,
                                                std::string& warning);

    /// @brief Write every setting, creating parent directories
    [[nodiscard]] static VoidResult<ConfigError> saveTo(const Settings& settings,
                                                        const std::filesystem::path& path);

    [[nodiscard]] static ValidationResult validate(const Settings& settings);
};

}  // namespace verinfo::config
