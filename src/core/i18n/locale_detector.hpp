/// @file locale_detector.hpp
/// @brief System culture detection and string table resolution

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace verinfo::i18n {

/// @brief Detect the system culture tag (e.g. "en-US", "de-DE")
/// Uses ICU uloc_getDefault() and joins the language and region subtags.
/// Falls back to "en-US" if detection fails.
[[nodiscard]] std::string detectSystemCulture();

/// @brief Resolve the culture whose string table should be loaded.
///
/// Resolution order: exact table for the requested culture, then the first
/// available table with the same language subtag ("de" matches "de-AT"),
/// then the default culture.
///
/// @param language "auto" for system detection, or an explicit culture tag
/// @param languages_dir Directory containing Strings.<culture>.xaml files
/// @param default_culture Culture used when nothing better is available
[[nodiscard]] std::string resolveCulture(std::string_view language,
                                         const std::filesystem::path& languages_dir,
                                         std::string_view default_culture);

/// @brief Extract the language subtag from a culture tag ("pt-BR" -> "pt")
[[nodiscard]] std::string_view languageSubtag(std::string_view culture) noexcept;

}  // namespace verinfo::i18n
