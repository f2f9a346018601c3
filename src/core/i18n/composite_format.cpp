/// @file composite_format.cpp
/// @brief Pre-validated positional format strings implementation

#include "composite_format.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "core/util/logger.hpp"

#include "icu_formatter.hpp"

namespace verinfo::i18n {

namespace {

// Longer digit runs cannot name one of the four arguments and would overflow.
constexpr size_t kMaxIndexDigits = 9;

struct ArgumentScan {
    size_t count = 0;
    bool string_only = true;
};

bool isPatternSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Skips an apostrophe quote starting at i, using ICU's DOUBLE_OPTIONAL rules.
size_t skipQuote(std::string_view pattern, size_t i) noexcept {
    if (i + 1 >= pattern.size()) {
        return i + 1;
    }
    char next = pattern[i + 1];
    if (next == '\'') {
        return i + 2;
    }
    if (next != '{' && next != '}') {
        return i + 1;
    }
    i += 2;
    while (i < pattern.size()) {
        if (pattern[i] == '\'') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '\'') {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return i;
}

ArgumentScan scanArguments(std::string_view pattern) noexcept {
    ArgumentScan scan;
    size_t i = 0;
    while (i < pattern.size()) {
        char c = pattern[i];
        if (c == '\'') {
            i = skipQuote(pattern, i);
            continue;
        }
        if (c != '{') {
            ++i;
            continue;
        }

        size_t j = i + 1;
        while (j < pattern.size() && isPatternSpace(pattern[j])) {
            ++j;
        }
        size_t index = 0;
        size_t digits = 0;
        while (j < pattern.size() && pattern[j] >= '0' && pattern[j] <= '9') {
            if (digits < kMaxIndexDigits) {
                index = index * 10 + static_cast<size_t>(pattern[j] - '0');
            }
            ++digits;
            ++j;
        }
        while (j < pattern.size() && isPatternSpace(pattern[j])) {
            ++j;
        }

        bool valid_index = digits > 0 && digits <= kMaxIndexDigits;
        if (valid_index) {
            scan.count = std::max(scan.count, index + 1);
        }
        if (!valid_index || j >= pattern.size() || pattern[j] != '}') {
            scan.string_only = false;
        }

        // Step over the whole argument, nested sub-messages included
        size_t depth = 0;
        for (; i < pattern.size(); ++i) {
            if (pattern[i] == '{') {
                ++depth;
            } else if (pattern[i] == '}' && --depth == 0) {
                ++i;
                break;
            }
        }
    }
    return scan;
}

}  // namespace

size_t countPlaceholders(std::string_view pattern) noexcept {
    return scanArguments(pattern).count;
}

bool hasOnlyStringArguments(std::string_view pattern) noexcept {
    return scanArguments(pattern).string_only;
}

std::expected<CompositeFormat, FormatError> CompositeFormat::parse(std::string_view pattern,
                                                                   std::string_view locale) {
    size_t arguments = countPlaceholders(pattern);
    if (arguments > kMaxFormatArgs) {
        return std::unexpected(FormatError::TooManyArguments);
    }
    // Arguments are always passed as strings, so typed arguments cannot be formatted
    if (!hasOnlyStringArguments(pattern) || !icuValidatePattern(pattern, locale)) {
        return std::unexpected(FormatError::InvalidPattern);
    }
    return CompositeFormat(std::string(pattern), std::string(locale), arguments);
}

std::string CompositeFormat::format(std::initializer_list<std::string_view> args) const {
    std::vector<std::string> values;
    values.reserve(args.size());
    for (auto arg : args) {
        // Extra arguments are ignored, as with String.Format
        if (values.size() == kMaxFormatArgs) {
            break;
        }
        values.emplace_back(arg);
    }

    auto formatted = icuFormat(pattern_, locale_, values);
    if (!formatted) {
        LOG_ERROR("Failed to format \"{}\"", pattern_);
        return pattern_;
    }
    return std::move(*formatted);
}

}  // namespace verinfo::i18n
