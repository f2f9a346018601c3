/// @file app.cpp
/// @brief Main application implementation

#include "app.hpp"

#include <iostream>

#include "core/config/settings_manager.hpp"
#include "core/i18n/i18n.hpp"
#include "core/i18n/language_stats.hpp"
#include "core/sysinfo/cim_query.hpp"
#include "core/sysinfo/environment_info.hpp"
#include "core/sysinfo/registry_info.hpp"
#include "core/util/logger.hpp"
#include "core/util/string_utils.hpp"
#include "core/util/win32_utils.hpp"
#include "info_collector.hpp"
#include "report.hpp"

namespace verinfo::app {

App& App::instance() {
    static App app;
    return app;
}

std::filesystem::path resolveAgainstExecutable(const std::filesystem::path& path) {
    if (path.is_absolute()) {
        return path;
    }
    auto exe_dir = getExecutableDirectory();
    return exe_dir.empty() ? path : exe_dir / path;
}

bool App::initialize(const Options& options) {
    options_ = options;

    // Load settings. Logging is not configured yet, so a warning is kept for later.
    std::string settings_warning;
    if (options_.config_path) {
        auto loaded = config::SettingsManager::loadFrom(*options_.config_path);
        if (!loaded) {
            std::cerr << "Cannot load " << pathToUtf8(*options_.config_path) << ": "
                      << config::to_string(loaded.error()) << '\n';
            return false;
        }
        settings_ = std::move(*loaded);
    } else {
        settings_ = config::SettingsManager::loadOrDefault(config::SettingsManager::defaultPath(),
                                                           settings_warning);
    }

    if (options_.language) {
        settings_.language.language = *options_.language;
    }

    initializeLogging();

    if (!settings_warning.empty()) {
        LOG_WARN("{}", settings_warning);
    }

    auto validation = config::SettingsManager::validate(settings_);
    for (const auto& warning : validation.warnings) {
        LOG_WARN("Settings: {}", warning);
    }
    if (!validation.valid) {
        for (const auto& error : validation.errors) {
            LOG_ERROR("Settings: {}", error);
            std::cerr << "Invalid settings: " << error << '\n';
        }
        return false;
    }

    initializeI18n();

    initialized_ = true;
    return true;
}

void App::initializeLogging() {
    auto log_path = settings_.logging.file;
    if (log_path.empty()) {
        if (auto local_app_data = getLocalAppdataPath()) {
            log_path = *local_app_data / L"verinfo" / L"verinfo.log";
        } else {
            log_path = L"verinfo.log";
        }
    }

    std::error_code ec;
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }

    auto level = logLevelFromString(settings_.logging.level);
    bool console = settings_.logging.console;
    if (options_.verbose) {
        level = spdlog::level::debug;
        console = true;
    }

    if (!init_logging(log_path, console, level)) {
        // Keep going without the file
        init_logging({}, console, level);
    }
    LOG_INFO("verinfo starting...");
}

void App::initializeI18n() {
    auto languages_dir = resolveAgainstExecutable(settings_.language.directory);
    auto result = i18n::init(languages_dir, settings_.language.language,
                             settings_.language.default_culture);
    if (!result) {
        LOG_WARN("i18n init failed: {}", i18n::to_string(result.error()));
    }

    switch (settings_.missing_resources) {
    case config::MissingResourcePolicy::Auto:
        i18n::setMissingResourceMode(i18n::MissingResourceMode::Auto);
        break;
    case config::MissingResourcePolicy::Throw:
        i18n::setMissingResourceMode(i18n::MissingResourceMode::Throw);
        break;
    case config::MissingResourcePolicy::Placeholder:
        i18n::setMissingResourceMode(i18n::MissingResourceMode::Placeholder);
        break;
    }

    LOG_INFO("UI culture {} (default {})", i18n::currentCulture(), i18n::defaultCulture());
}

void App::compareOnStartup() {
    if (!settings_.language.compare_on_startup) {
        return;
    }
    if (equalsIcase(i18n::currentCulture(), i18n::defaultCulture())) {
        return;
    }
    // Findings go to the log only
    auto comparison = i18n::compareLanguageDictionaries();
    if (!comparison) {
        LOG_WARN("Startup comparison skipped: {}", i18n::to_string(comparison.error()));
    }
}

int App::run() {
    if (!initialized_) {
        return kExitFailure;
    }

    try {
        // --compare runs the comparison itself
        if (options_.command != Command::Compare) {
            compareOnStartup();
        }

        auto& out = std::cout;
        switch (options_.command) {
        case Command::Report:
            return runReport(out);
        case Command::Languages:
            return runLanguages(out);
        case Command::Compare:
            return runCompare(out);
        case Command::Registry:
            return runRegistry(out);
        case Command::Cim:
            return runCim(out);
        case Command::Env:
            return runEnv(out);
        case Command::Folder:
            return runFolder(out);
        case Command::Help:
            out << usageText();
            return kExitSuccess;
        }
    } catch (const i18n::ResourceNotFound& ex) {
        LOG_CRITICAL("{}", ex.what());
        std::cerr << ex.what() << '\n';
        return kExitFailure;
    }

    return kExitFailure;
}

void App::shutdown() {
    if (initialized_) {
        LOG_INFO("verinfo shutting down");
    }
    shutdown_logging();
    initialized_ = false;
}

int App::runReport(std::ostream& out) {
    printReport(out, collectSections(options_.section));
    return kExitSuccess;
}

int App::runLanguages(std::ostream& out) {
    InfoSection section{i18n::getStringResource("LanguageInfo_Title"), {}};
    for (auto& [culture, percent] : i18n::languageCoverage()) {
        section.add(culture, percent);
    }
    if (section.rows.empty()) {
        out << i18n::getStringResource("LanguageInfo_NoTables") << '\n';
        return kExitFailure;
    }
    printSection(out, section);
    return kExitSuccess;
}

int App::runCompare(std::ostream& out) {
    auto comparison = i18n::compareLanguageDictionaries(options_.argument);
    if (!comparison) {
        auto message = comparison.error() == i18n::ResourceError::FileNotFound
                           ? i18n::getStringResource("MsgText_ErrorOpeningFile")
                           : i18n::getStringResource("MsgText_ErrorReadingFile");
        out << message << ": " << i18n::to_string(comparison.error()) << '\n';
        return kExitFailure;
    }

    std::string culture = options_.argument.empty() ? i18n::currentCulture() : options_.argument;
    if (comparison->sameKeys()) {
        out << i18n::compositeResource("LanguageInfo_SameKeys")
                   .format({i18n::defaultCulture(), culture})
            << '\n';
        return kExitSuccess;
    }

    InfoSection section{i18n::compositeResource("LanguageInfo_CompareTitle")
                            .format({i18n::defaultCulture(), culture}),
                        {}};
    for (const auto& key : comparison->missing_keys) {
        section.add(key, i18n::getStringResource("LanguageInfo_Missing"));
    }
    for (const auto& key : comparison->extra_keys) {
        section.add(key, i18n::getStringResource("LanguageInfo_Extra"));
    }
    printSection(out, section);
    return kExitSuccess;
}

int App::runRegistry(std::ostream& out) {
    out << sysinfo::getRegistryInfo(options_.argument) << '\n';
    return kExitSuccess;
}

int App::runCim(std::ostream& out) {
    auto cls = sysinfo::cimClassFromString(options_.cim_class);
    if (!cls) {
        std::cerr << "Unknown CIM class: " << options_.cim_class << '\n' << usageText();
        return kExitUsage;
    }
    out << sysinfo::cimQuery(*cls, options_.argument) << '\n';
    return kExitSuccess;
}

int App::runEnv(std::ostream& out) {
    out << sysinfo::getEnvironment(options_.argument) << '\n';
    return kExitSuccess;
}

int App::runFolder(std::ostream& out) {
    auto folder = sysinfo::specialFolderFromString(options_.argument);
    if (!folder) {
        std::cerr << "Unknown folder: " << options_.argument << '\n' << usageText();
        return kExitUsage;
    }
    out << sysinfo::getSpecialFolder(*folder) << '\n';
    return kExitSuccess;
}

}  // namespace verinfo::app
