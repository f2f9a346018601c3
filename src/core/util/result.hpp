/// @file result.hpp
/// @brief Error handling utilities using std::expected
///
/// Provides Result<T, E> type alias and helper functions for
/// consistent error handling throughout the codebase. Error enums are
/// expected to provide a to_string() overload found by ADL.

#pragma once

#include <expected>
#include <source_location>
#include <string_view>

#include "logger.hpp"

namespace verinfo {

/// @brief Result type alias for functions that can fail
/// @tparam T Success value type
/// @tparam E Error type
template <typename T, typename E>
using Result = std::expected<T, E>;

/// @brief Result type for void-returning functions that can fail
/// @tparam E Error type
template <typename E>
using VoidResult = std::expected<void, E>;

/// @brief Create an error result
/// @param error The error value
/// @return std::unexpected containing the error
template <typename E>
[[nodiscard]] constexpr auto makeError(E error) {
    return std::unexpected(error);
}

/// @brief Log and return an error (for chaining)
///
/// Usage:
///   return logAndReturn(SomeError::Failed, "context info");
template <typename E>
[[nodiscard]] auto logAndReturn(E error, std::string_view context = "",
                                std::source_location loc = std::source_location::current()) {
    spdlog::default_logger_raw()->log(
        spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
        spdlog::level::err, "{}: {}", context, to_string(error));
    return std::unexpected(error);
}

}  // namespace verinfo

/// @brief Propagate error without extracting value
///
/// Usage:
///   VERINFO_TRY_VOID(some_void_operation());
#define VERINFO_TRY_VOID(expr)                                                                     \
    do {                                                                                           \
        auto&& _result = (expr);                                                                   \
        if (!_result) {                                                                            \
            return std::unexpected(_result.error());                                               \
        }                                                                                          \
    } while (0)
