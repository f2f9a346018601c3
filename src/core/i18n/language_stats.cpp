/// @file language_stats.cpp
/// @brief Translation completeness and key-set comparison implementation

#include "language_stats.hpp"

#include <algorithm>
#include <format>
#include <iterator>

#include "core/util/logger.hpp"
#include "core/util/string_utils.hpp"

#include "i18n.hpp"

namespace verinfo::i18n {

namespace {

constexpr std::string_view kApplicationName = "verinfo";

const std::string& separatorLine() {
    static const std::string line(80, '-');
    return line;
}

void logKeys(const std::vector<std::string>& keys, const ResourceDictionary& source) {
    for (const auto& key : keys) {
        const auto* value = source.find(key);
        LOG_WARN("Key: {}    Value: \"{}\"", key, value ? *value : std::string());
    }
}

}  // namespace

size_t getTotalDefaultLanguageCount() {
    auto path = dictionaryPath(languagesDirectory(), defaultCulture());
    auto table = ResourceDictionary::load(path);
    if (!table) {
        LOG_ERROR("Cannot count strings in {}: {}", pathToUtf8(path), to_string(table.error()));
        return 0;
    }
    return table->size();
}

std::string formatPercent(size_t percent) {
    return std::format("{} %", percent);
}

std::string getLanguagePercent(std::string_view culture) {
    auto path = dictionaryPath(languagesDirectory(), culture);

    auto table = ResourceDictionary::load(path);
    if (!table) {
        LOG_ERROR("Error in GetLanguagePercent for {}: {}", pathToUtf8(path),
                  to_string(table.error()));
        return getStringResource("MsgText_Error_Caption");
    }

    size_t total = getTotalDefaultLanguageCount();
    if (total == 0) {
        LOG_ERROR("GetLanguagePercent totalCount is 0 for default dictionary");
        return getStringResource("MsgText_Error_Caption");
    }
    if (table->empty()) {
        LOG_ERROR("GetLanguagePercent Count is 0 for {}", pathToUtf8(path));
        return getStringResource("MsgText_Error_Caption");
    }

    return formatPercent(languagePercent(table->size(), total));
}

KeyComparison compareKeys(const ResourceDictionary& reference, const ResourceDictionary& other) {
    // keys() is sorted, so set_difference yields ordinal order directly
    auto reference_keys = reference.keys();
    auto other_keys = other.keys();

    KeyComparison result;
    std::set_difference(reference_keys.begin(), reference_keys.end(), other_keys.begin(),
                        other_keys.end(), std::back_inserter(result.missing_keys));
    std::set_difference(other_keys.begin(), other_keys.end(), reference_keys.begin(),
                        reference_keys.end(), std::back_inserter(result.extra_keys));
    return result;
}

std::expected<KeyComparison, ResourceError> compareLanguageDictionaries(
    std::string_view culture) {
    std::string compared = culture.empty() ? currentCulture() : std::string(culture);
    auto dir = languagesDirectory();
    auto reference_path = dictionaryPath(dir, defaultCulture());
    auto compared_path = dictionaryPath(dir, compared);

    std::string reference_name = pathToUtf8(reference_path);
    std::string compared_name = pathToUtf8(compared_path);
    LOG_INFO("Comparing {} and {}", reference_name, compared_name);

    auto reference = ResourceDictionary::load(reference_path);
    if (!reference) {
        LOG_ERROR("Cannot load {}: {}", reference_name, to_string(reference.error()));
        return std::unexpected(reference.error());
    }
    auto other = ResourceDictionary::load(compared_path);
    if (!other) {
        LOG_ERROR("Cannot load {}: {}", compared_name, to_string(other.error()));
        return std::unexpected(other.error());
    }

    auto comparison = compareKeys(*reference, *other);
    if (comparison.sameKeys()) {
        LOG_INFO("{} and {} have the same keys", reference_name, compared_name);
        return comparison;
    }

    if (!comparison.missing_keys.empty()) {
        LOG_INFO("{}", separatorLine());
        LOG_WARN("[{}] {} is missing the following keys", kApplicationName, compared_name);
        logKeys(comparison.missing_keys, *reference);
        LOG_INFO("{}", separatorLine());
    }

    if (!comparison.extra_keys.empty()) {
        LOG_WARN("[{}] {} has keys that {} does not have.", kApplicationName, compared_name,
                 reference_name);
        logKeys(comparison.extra_keys, *other);
        LOG_INFO("{}", separatorLine());
    }

    return comparison;
}

std::vector<std::pair<std::string, std::string>> languageCoverage() {
    std::vector<std::pair<std::string, std::string>> coverage;
    for (auto& culture : listAvailableCultures(languagesDirectory())) {
        auto percent = getLanguagePercent(culture);
        coverage.emplace_back(std::move(culture), std::move(percent));
    }
    return coverage;
}

}  // namespace verinfo::i18n
