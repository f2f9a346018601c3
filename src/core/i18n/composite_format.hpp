/// @file composite_format.hpp
/// @brief Pre-validated positional format strings ("{0} of {1}")

#pragma once

#include <cstddef>
#include <expected>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace verinfo::i18n {

/// @brief Errors raised when a format pattern is rejected
enum class FormatError {
    InvalidPattern,
    TooManyArguments,
};

/// @brief Get string representation of FormatError
[[nodiscard]] constexpr std::string_view to_string(FormatError error) noexcept {
    switch (error) {
    case FormatError::InvalidPattern:
        return "Invalid format pattern";
    case FormatError::TooManyArguments:
        return "Format pattern uses too many arguments";
    }
    return "Unknown format error";
}

/// @brief A format pattern that ICU has already accepted.
///
/// Placeholders are positional ({0}..{3}) and receive string arguments.
/// Full ICU MessageFormat syntax is accepted; a lone apostrophe is literal
/// unless it precedes a brace.
class CompositeFormat {
public:
    /// @brief Validate a pattern
    /// @param pattern UTF-8 pattern
    /// @param locale Culture used by ICU for locale-sensitive sub-formats
    [[nodiscard]] static std::expected<CompositeFormat, FormatError> parse(
        std::string_view pattern, std::string_view locale = "en-US");

    /// @brief Wrap text that is used verbatim (no validation, no placeholders)
    [[nodiscard]] static CompositeFormat literal(std::string text) {
        return CompositeFormat(std::move(text), "en-US", 0);
    }

    /// @brief Substitute arguments into the pattern
    /// @return Formatted text; the raw pattern if ICU fails at format time
    [[nodiscard]] std::string format(std::initializer_list<std::string_view> args = {}) const;

    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }

    /// @brief Highest placeholder index + 1 (0 for literal text)
    [[nodiscard]] size_t argumentCount() const noexcept { return argument_count_; }

private:
    CompositeFormat(std::string pattern, std::string locale, size_t argument_count)
        : pattern_(std::move(pattern)), locale_(std::move(locale)),
          argument_count_(argument_count) {}

    std::string pattern_;
    std::string locale_;
    size_t argument_count_ = 0;
};

/// @brief Scan a pattern for the highest positional placeholder
/// @return Highest index + 1, or 0 when the pattern has no placeholders
[[nodiscard]] size_t countPlaceholders(std::string_view pattern) noexcept;

/// @brief True when every placeholder is a plain `{N}` argument
/// @details Typed (`{0,number}`), named and oversized arguments return false.
[[nodiscard]] bool hasOnlyStringArguments(std::string_view pattern) noexcept;

}  // namespace verinfo::i18n
