/// @file language_stats.hpp
/// @brief Translation completeness and key-set comparison

#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "resource_dictionary.hpp"

namespace verinfo::i18n {

/// @brief Key-set difference between a reference table and another table
struct KeyComparison {
    std::vector<std::string> missing_keys;  // in the reference only, ordinal order
    std::vector<std::string> extra_keys;    // in the other table only, ordinal order

    [[nodiscard]] bool sameKeys() const noexcept {
        return missing_keys.empty() && extra_keys.empty();
    }
};

/// @brief Number of strings in the default culture's table (0 if it cannot be loaded)
[[nodiscard]] size_t getTotalDefaultLanguageCount();

/// @brief Whole percentage of count relative to total, truncated toward zero.
/// Exceeds 100 when count > total. Returns 0 when total is 0.
[[nodiscard]] constexpr size_t languagePercent(size_t count, size_t total) noexcept {
    return total == 0 ? 0 : count * 100 / total;
}

/// @brief Render a whole percentage the way .NET's invariant "P0" does ("87 %")
[[nodiscard]] std::string formatPercent(size_t percent);

/// @brief Translation completeness of a culture as a display string.
///
/// Divides the culture's string count by the default culture's count. When
/// either count is zero or a table cannot be read, the failure is logged and
/// the localized "MsgText_Error_Caption" string is returned instead.
[[nodiscard]] std::string getLanguagePercent(std::string_view culture);

/// @brief Compare key sets of two tables
[[nodiscard]] KeyComparison compareKeys(const ResourceDictionary& reference,
                                        const ResourceDictionary& other);

/// @brief Compare the default culture's table with another culture's table and
/// log the differences. Uses the current culture when culture is empty.
[[nodiscard]] std::expected<KeyComparison, ResourceError> compareLanguageDictionaries(
    std::string_view culture = {});

/// @brief Completeness of every culture found in the languages directory
/// @return (culture, percent string) pairs in culture order
[[nodiscard]] std::vector<std::pair<std::string, std::string>> languageCoverage();

}  // namespace verinfo::i18n
