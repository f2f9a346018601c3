/// @file settings_manager.cpp
/// @brief Settings persistence implementation using toml++

#include "settings_manager.hpp"

#include <format>
#include <fstream>

#include <toml++/toml.hpp>

#include "core/util/logger.hpp"
#include "core/util/string_utils.hpp"

#ifdef _WIN32
    #include "core/util/win32_utils.hpp"
#endif

namespace verinfo::config {

namespace {

constexpr std::string_view kValidLogLevels[] = {"trace", "debug", "info",    "warn",
                                                "error", "critical", "off"};

// Helper to get optional value from toml table
template <typename T>
T get_or(const toml::table& tbl, std::string_view key, T default_value) {
    if (auto val = tbl[key].value<T>()) {
        return *val;
    }
    return default_value;
}

Settings parse_settings(const toml::table& tbl) {
    Settings settings;

    // Language settings
    if (auto* language = tbl["language"].as_table()) {
        settings.language.language = get_or<std::string>(*language, "language", "auto");
        settings.language.default_culture =
            get_or<std::string>(*language, "default_culture", "en-US");
        settings.language.directory =
            utf8ToPath(get_or<std::string>(*language, "directory", "Languages"));
        settings.language.compare_on_startup = get_or(*language, "compare_on_startup", true);
    }

    // Logging settings
    if (auto* logging = tbl["logging"].as_table()) {
        settings.logging.level = toLowercaseAscii(get_or<std::string>(*logging, "level", "info"));
        settings.logging.console = get_or(*logging, "console", false);
        settings.logging.file = utf8ToPath(get_or<std::string>(*logging, "file", ""));
    }

    // Resource lookup settings
    if (auto* resources = tbl["resources"].as_table()) {
        auto policy_str = get_or<std::string>(*resources, "missing", "auto");
        settings.missing_resources = missingResourcePolicyFromString(policy_str);
    }

    return settings;
}

toml::table serialize_settings(const Settings& settings) {
    toml::table tbl;

    tbl.insert("language",
               toml::table{
                   {          "language",                  settings.language.language},
                   {   "default_culture",           settings.language.default_culture},
                   {         "directory", pathToUtf8(settings.language.directory)},
                   {"compare_on_startup",        settings.language.compare_on_startup},
    });

    tbl.insert("logging", toml::table{
                              {  "level",                settings.logging.level},
                              {"console",              settings.logging.console},
                              {   "file", pathToUtf8(settings.logging.file)},
    });

    tbl.insert("resources", toml::table{
                                {"missing", std::string(to_string(settings.missing_resources))},
    });

    return tbl;
}

}  // namespace

std::filesystem::path SettingsManager::defaultPath() {
#ifdef _WIN32
    // Try %LOCALAPPDATA%/verinfo/settings.toml
    if (auto local_app_data = getLocalAppdataPath()) {
        return *local_app_data / L"verinfo" / L"settings.toml";
    }

    // Fallback to executable directory
    auto exe_dir = getExecutableDirectory();
    if (!exe_dir.empty()) {
        return exe_dir / L"settings.toml";
    }
#endif
    return "settings.toml";
}

Result<Settings, ConfigError> SettingsManager::loadFrom(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return makeError(ConfigError::FileNotFound);
    }

    try {
        auto tbl = toml::parse_file(pathToUtf8(path));
        return parse_settings(tbl);
    } catch (const toml::parse_error& ex) {
        LOG_ERROR("Failed to parse {}: {} (line {})", pathToUtf8(path), ex.description(),
                  ex.source().begin.line);
        return makeError(ConfigError::ParseError);
    }
}

Settings SettingsManager::loadOrDefault(const std::filesystem::path& path,
                                        std::string& warning) {
    warning.clear();
    auto result = loadFrom(path);
    if (result) {
        return *result;
    }
    if (result.error() != ConfigError::FileNotFound) {
        warning = std::format("Using default settings, {} is unusable: {}", pathToUtf8(path),
                              to_string(result.error()));
        LOG_WARN("{}", warning);
    }
    return Settings::defaults();
}

VoidResult<ConfigError> SettingsManager::saveTo(const Settings& settings,
                                                const std::filesystem::path& path) {
    try {
        // Create parent directories
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file) {
            return logAndReturn(ConfigError::IoError, pathToUtf8(path));
        }

        auto tbl = serialize_settings(settings);
        file << "# verinfo configuration\n\n" << tbl << "\n";
        if (!file) {
            return logAndReturn(ConfigError::IoError, pathToUtf8(path));
        }

        return {};
    } catch (const std::exception& ex) {
        return logAndReturn(ConfigError::IoError, pathToUtf8(path) + ": " + ex.what());
    }
}

ValidationResult SettingsManager::validate(const Settings& settings) {
    ValidationResult result;

    if (trim(settings.language.default_culture).empty()) {
        result.errors.push_back("language.default_culture must not be empty");
        result.valid = false;
    }

    if (settings.language.directory.empty()) {
        result.errors.push_back("language.directory must not be empty");
        result.valid = false;
    }

    if (trim(settings.language.language).empty()) {
        result.errors.push_back("language.language must be \"auto\" or a culture tag");
        result.valid = false;
    }

    bool known_level = false;
    for (auto level : kValidLogLevels) {
        if (settings.logging.level == level) {
            known_level = true;
            break;
        }
    }
    if (!known_level) {
        result.errors.push_back(
            "logging.level must be one of trace, debug, info, warn, error, critical, off");
        result.valid = false;
    }

    // Warnings
    if (settings.logging.console && settings.logging.level == "trace") {
        result.warnings.push_back("Trace logging to the console interleaves with the report");
    }

    if (settings.missing_resources == MissingResourcePolicy::Throw) {
        result.warnings.push_back("Missing string resources will stop the program with an error");
    }

    return result;
}

}  // namespace verinfo::config
