/// @file i18n.cpp
/// @brief Internationalization singleton state and dispatch

#include "i18n.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include "core/util/debugger.hpp"
#include "core/util/logger.hpp"
#include "core/util/string_utils.hpp"

#include "locale_detector.hpp"
#include "resource_dictionary.hpp"

namespace verinfo::i18n {

namespace {

// Global i18n state protected by shared_mutex
struct I18nState {
    ResourceDictionary default_table;
    std::optional<ResourceDictionary> culture_table;  // empty when culture == default
    std::string culture;
    std::string default_culture = "en-US";
    std::filesystem::path languages_dir;
    // Composite formats parsed from resources (key -> format)
    std::unordered_map<std::string, CompositeFormat> format_cache;
    mutable std::shared_mutex mutex;
    bool initialized = false;
};

I18nState& state() {
    static I18nState s;
    return s;
}

std::atomic<MissingResourceMode> g_missing_mode{MissingResourceMode::Auto};

std::optional<std::string> lookup(const I18nState& s, std::string_view key) {
    if (s.culture_table) {
        if (const auto* value = s.culture_table->find(key)) {
            return *value;
        }
    }
    if (const auto* value = s.default_table.find(key)) {
        return *value;
    }
    return std::nullopt;
}

std::expected<void, I18nError> loadTables(I18nState& s, std::string_view language) {
    auto default_path = dictionaryPath(s.languages_dir, s.default_culture);
    auto default_table = ResourceDictionary::load(default_path);
    if (!default_table) {
        LOG_ERROR("Cannot load {}: {}", pathToUtf8(default_path), to_string(default_table.error()));
        if (default_table.error() == ResourceError::FileNotFound) {
            return std::unexpected(I18nError::StringTableNotFound);
        }
        return std::unexpected(I18nError::StringTableInvalid);
    }

    std::string tag = resolveCulture(language, s.languages_dir, s.default_culture);

    std::optional<ResourceDictionary> culture_table;
    if (tag != s.default_culture) {
        auto culture_path = dictionaryPath(s.languages_dir, tag);
        auto loaded = ResourceDictionary::load(culture_path);
        if (loaded) {
            culture_table = std::move(*loaded);
        } else {
            // Degrade to the default culture rather than failing startup
            LOG_ERROR("Cannot load {}: {}", pathToUtf8(culture_path), to_string(loaded.error()));
            tag = s.default_culture;
        }
    }

    s.default_table = std::move(*default_table);
    s.culture_table = std::move(culture_table);
    s.culture = tag;
    s.format_cache.clear();
    s.initialized = true;

    LOG_INFO("Language set to {} ({} strings, default {} has {})", s.culture,
             s.culture_table ? s.culture_table->size() : s.default_table.size(),
             s.default_culture, s.default_table.size());
    return {};
}

}  // namespace

std::expected<void, I18nError> init(const std::filesystem::path& languages_dir,
                                    std::string_view language, std::string_view default_culture) {
    auto& s = state();
    std::unique_lock lock(s.mutex);

    s.languages_dir = languages_dir;
    s.default_culture = std::string(default_culture);
    return loadTables(s, language);
}

std::expected<void, I18nError> reload(std::string_view language) {
    auto& s = state();
    std::unique_lock lock(s.mutex);

    return loadTables(s, language);
}

std::optional<std::string> findStringResource(std::string_view key) {
    auto& s = state();
    std::shared_lock lock(s.mutex);

    return lookup(s, key);
}

std::string getStringResource(std::string_view key) {
    if (auto value = findStringResource(key)) {
        return std::move(*value);
    }

    auto mode = missingResourceMode();
    if (mode == MissingResourceMode::Throw ||
        (mode == MissingResourceMode::Auto && isDebuggerAttached())) {
        throw ResourceNotFound(std::string(key));
    }

    LOG_ERROR("Resource not found: {}", key);
    return "Resource not found: " + std::string(key);
}

CompositeFormat compositeResource(std::string_view key) {
    auto& s = state();
    {
        std::shared_lock lock(s.mutex);
        auto it = s.format_cache.find(std::string(key));
        if (it != s.format_cache.end()) {
            return it->second;
        }
    }

    std::string culture = currentCulture();
    std::expected<CompositeFormat, FormatError> parsed =
        std::unexpected(FormatError::InvalidPattern);
    try {
        parsed = CompositeFormat::parse(getStringResource(key), culture);
    } catch (const ResourceNotFound& ex) {
        LOG_ERROR("{}", ex.what());
    }
    if (!parsed) {
        LOG_ERROR("Error creating composite format for key: {} ({})", key,
                  to_string(parsed.error()));
        return CompositeFormat::literal("Error creating composite format for key: " +
                                        std::string(key));
    }

    std::unique_lock lock(s.mutex);
    auto [it, inserted] = s.format_cache.emplace(std::string(key), *parsed);
    return it->second;
}

void setMissingResourceMode(MissingResourceMode mode) noexcept {
    g_missing_mode.store(mode);
}

MissingResourceMode missingResourceMode() noexcept {
    return g_missing_mode.load();
}

std::string currentCulture() {
    auto& s = state();
    std::shared_lock lock(s.mutex);
    return s.initialized ? s.culture : s.default_culture;
}

std::string defaultCulture() {
    auto& s = state();
    std::shared_lock lock(s.mutex);
    return s.default_culture;
}

std::filesystem::path languagesDirectory() {
    auto& s = state();
    std::shared_lock lock(s.mutex);
    return s.languages_dir;
}

}  // namespace verinfo::i18n
