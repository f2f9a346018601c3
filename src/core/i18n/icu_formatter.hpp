/// @file icu_formatter.hpp
/// @brief ICU MessageFormat wrapper for positional string arguments

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace verinfo::i18n {

/// @brief Maximum number of positional arguments accepted by icuFormat()
inline constexpr size_t kMaxFormatArgs = 4;

/// @brief Check that a pattern compiles as an ICU MessageFormat
/// @param pattern UTF-8 pattern (e.g. "{0} days, {1} hours")
/// @param locale ICU locale string (e.g. "en-US")
[[nodiscard]] bool icuValidatePattern(std::string_view pattern, std::string_view locale);

/// @brief Format a message using ICU MessageFormat syntax.
///
/// Uses the ICU C API (umsg_open / umsg_format / umsg_close). Arguments are
/// passed as strings to positional placeholders {0}..{3}; missing arguments
/// are substituted with empty strings.
///
/// @param pattern UTF-8 pattern
/// @param locale ICU locale string
/// @param args Positional arguments (at most kMaxFormatArgs)
/// @return Formatted UTF-8 string, or std::nullopt if ICU rejects the pattern
[[nodiscard]] std::optional<std::string> icuFormat(std::string_view pattern,
                                                   std::string_view locale,
                                                   const std::vector<std::string>& args);

}  // namespace verinfo::i18n
