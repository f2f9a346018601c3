/// @file locale_detector.cpp
/// @brief System culture detection using ICU

#include "locale_detector.hpp"

#include "core/util/string_utils.hpp"

#include "icu_api.hpp"
#include "resource_dictionary.hpp"

namespace verinfo::i18n {

std::string detectSystemCulture() {
    // Get the default ICU locale (e.g. "en_US", "de_DE")
    const char* default_locale = uloc_getDefault();
    if (!default_locale || default_locale[0] == '\0') {
        return "en-US";
    }

    char language[ULOC_LANG_CAPACITY] = {};
    UErrorCode status = U_ZERO_ERROR;
    int32_t len = uloc_getLanguage(default_locale, language, ULOC_LANG_CAPACITY, &status);
    if (U_FAILURE(status) || len <= 0) {
        return "en-US";
    }

    std::string tag(language, static_cast<size_t>(len));

    char country[ULOC_COUNTRY_CAPACITY] = {};
    status = U_ZERO_ERROR;
    len = uloc_getCountry(default_locale, country, ULOC_COUNTRY_CAPACITY, &status);
    if (U_SUCCESS(status) && len > 0) {
        tag += '-';
        tag.append(country, static_cast<size_t>(len));
    }

    return tag;
}

std::string_view languageSubtag(std::string_view culture) noexcept {
    auto pos = culture.find_first_of("-_");
    return pos == std::string_view::npos ? culture : culture.substr(0, pos);
}

std::string resolveCulture(std::string_view language, const std::filesystem::path& languages_dir,
                           std::string_view default_culture) {
    std::string tag;

    if (language == "auto" || language.empty()) {
        tag = detectSystemCulture();
    } else {
        tag = std::string(language);
    }

    // Check if a string table exists for the resolved tag
    std::error_code ec;
    if (std::filesystem::exists(dictionaryPath(languages_dir, tag), ec)) {
        return tag;
    }

    // Same language, different region
    auto wanted = languageSubtag(tag);
    for (const auto& culture : listAvailableCultures(languages_dir)) {
        if (equalsIcase(languageSubtag(culture), wanted)) {
            return culture;
        }
    }

    return std::string(default_culture);
}

}  // namespace verinfo::i18n
