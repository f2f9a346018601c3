/// @file i18n.hpp
/// @brief Internationalization public API

#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "composite_format.hpp"

namespace verinfo::i18n {

/// @brief Errors that can occur during i18n operations
enum class I18nError {
    StringTableNotFound,
    StringTableInvalid,
};

/// @brief Get string representation of I18nError
[[nodiscard]] constexpr std::string_view to_string(I18nError error) noexcept {
    switch (error) {
    case I18nError::StringTableNotFound:
        return "Default string table not found";
    case I18nError::StringTableInvalid:
        return "Default string table could not be loaded";
    }
    return "Unknown i18n error";
}

/// @brief What getStringResource() does when a key is missing
enum class MissingResourceMode {
    Auto,         // Throw while a debugger is attached, placeholder otherwise
    Throw,        // Always throw ResourceNotFound
    Placeholder,  // Always log and return "Resource not found: <key>"
};

/// @brief Thrown by getStringResource() for a missing key in Throw mode
class ResourceNotFound : public std::runtime_error {
public:
    explicit ResourceNotFound(std::string key)
        : std::runtime_error("Resource not found: " + key), key_(std::move(key)) {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/// @brief Initialize the i18n system. Call once at startup after settings load.
///
/// Loads the default culture's string table, then overlays the table of the
/// resolved culture. Lookups fall back to the default culture.
///
/// @param languages_dir Directory containing Strings.<culture>.xaml files
/// @param language "auto" for system detection, or an explicit culture tag
/// @param default_culture Culture that every other table is measured against
/// @return void on success, or I18nError when the default table is unusable
[[nodiscard]] std::expected<void, I18nError> init(const std::filesystem::path& languages_dir,
                                                  std::string_view language = "auto",
                                                  std::string_view default_culture = "en-US");

/// @brief Switch to another culture, keeping directory and default culture.
/// Clears the composite format cache.
[[nodiscard]] std::expected<void, I18nError> reload(std::string_view language);

/// @brief Look up a localized string.
///
/// A missing key either throws ResourceNotFound or is logged and replaced by
/// "Resource not found: <key>", depending on the MissingResourceMode.
[[nodiscard]] std::string getStringResource(std::string_view key);

/// @brief Look up a localized string without logging or throwing
[[nodiscard]] std::optional<std::string> findStringResource(std::string_view key);

/// @brief Get a cached composite format built from a string resource.
///
/// If the resource is not a valid pattern the error is logged and a format
/// reading "Error creating composite format for key: <key>" is returned.
[[nodiscard]] CompositeFormat compositeResource(std::string_view key);

void setMissingResourceMode(MissingResourceMode mode) noexcept;

[[nodiscard]] MissingResourceMode missingResourceMode() noexcept;

/// @brief Culture of the active string table (e.g. "de-DE")
[[nodiscard]] std::string currentCulture();

/// @brief Culture of the reference string table (e.g. "en-US")
[[nodiscard]] std::string defaultCulture();

/// @brief Directory the string tables are loaded from
[[nodiscard]] std::filesystem::path languagesDirectory();

}  // namespace verinfo::i18n
