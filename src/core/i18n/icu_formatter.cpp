/// @file icu_formatter.cpp
/// @brief ICU MessageFormat wrapper implementation

#include "icu_formatter.hpp"

#include <array>

#include "icu_api.hpp"

namespace verinfo::i18n {

namespace {

// Convert UTF-8 to a null-terminated UChar buffer; invalid bytes become U+FFFD
std::vector<UChar> toUChar(std::string_view utf8) {
    UErrorCode status = U_ZERO_ERROR;
    int32_t length = 0;
    u_strFromUTF8WithSub(nullptr, 0, &length, utf8.data(), static_cast<int32_t>(utf8.size()),
                         0xFFFD, nullptr, &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
        return {};
    }

    std::vector<UChar> result(static_cast<size_t>(length) + 1, 0);
    status = U_ZERO_ERROR;
    u_strFromUTF8WithSub(result.data(), static_cast<int32_t>(result.size()), &length, utf8.data(),
                         static_cast<int32_t>(utf8.size()), 0xFFFD, nullptr, &status);
    if (U_FAILURE(status)) {
        return {};
    }
    return result;
}

// Convert UChar text to UTF-8
std::string toUtf8(const UChar* text, int32_t length) {
    UErrorCode status = U_ZERO_ERROR;
    int32_t size = 0;
    u_strToUTF8WithSub(nullptr, 0, &size, text, length, 0xFFFD, nullptr, &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
        return {};
    }

    std::string result(static_cast<size_t>(size), '\0');
    status = U_ZERO_ERROR;
    u_strToUTF8WithSub(result.data(), size, &size, text, length, 0xFFFD, nullptr, &status);
    if (U_FAILURE(status) && status != U_STRING_NOT_TERMINATED_WARNING) {
        return {};
    }
    return result;
}

// RAII owner for UMessageFormat
class MessageFormat {
public:
    MessageFormat(std::string_view pattern, std::string_view locale) {
        auto u_pattern = toUChar(pattern);
        if (u_pattern.empty()) {
            return;
        }
        std::string locale_str(locale);
        UErrorCode status = U_ZERO_ERROR;
        // Length excludes the terminator appended by toUChar()
        fmt_ = umsg_open(u_pattern.data(), static_cast<int32_t>(u_pattern.size() - 1),
                         locale_str.c_str(), nullptr, &status);
        if (U_FAILURE(status)) {
            close();
        }
    }

    ~MessageFormat() { close(); }

    MessageFormat(const MessageFormat&) = delete;
    MessageFormat& operator=(const MessageFormat&) = delete;

    [[nodiscard]] UMessageFormat* get() const noexcept { return fmt_; }

    [[nodiscard]] explicit operator bool() const noexcept { return fmt_ != nullptr; }

private:
    void close() noexcept {
        if (fmt_) {
            umsg_close(fmt_);
            fmt_ = nullptr;
        }
    }

    UMessageFormat* fmt_ = nullptr;
};

}  // namespace

bool icuValidatePattern(std::string_view pattern, std::string_view locale) {
    return static_cast<bool>(MessageFormat(pattern, locale));
}

std::optional<std::string> icuFormat(std::string_view pattern, std::string_view locale,
                                     const std::vector<std::string>& args) {
    if (args.size() > kMaxFormatArgs) {
        return std::nullopt;
    }

    MessageFormat fmt(pattern, locale);
    if (!fmt) {
        return std::nullopt;
    }

    // umsg_format is variadic; always pass kMaxFormatArgs strings so a pattern
    // referencing fewer placeholders never reads past the argument list
    std::array<std::vector<UChar>, kMaxFormatArgs> u_args;
    for (size_t i = 0; i < kMaxFormatArgs; ++i) {
        u_args[i] = toUChar(i < args.size() ? std::string_view(args[i]) : std::string_view());
        if (u_args[i].empty()) {
            u_args[i].push_back(0);
        }
    }

    auto run = [&](UChar* buffer, int32_t capacity, UErrorCode* status) {
        return umsg_format(fmt.get(), buffer, capacity, status, u_args[0].data(),
                           u_args[1].data(), u_args[2].data(), u_args[3].data());
    };

    // Preflight for the output length, then format into an exact buffer
    UErrorCode status = U_ZERO_ERROR;
    int32_t length = run(nullptr, 0, &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
        return std::nullopt;
    }
    if (length <= 0) {
        return std::string{};
    }

    std::vector<UChar> result(static_cast<size_t>(length) + 1, 0);
    status = U_ZERO_ERROR;
    length = run(result.data(), static_cast<int32_t>(result.size()), &status);
    if (U_FAILURE(status)) {
        return std::nullopt;
    }

    return toUtf8(result.data(), length);
}

}  // namespace verinfo::i18n
