/// @file string_utils.hpp
/// @brief String manipulation utilities
///
/// Platform-neutral helpers. UTF-8/UTF-16 conversion lives in win32_utils.hpp.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace verinfo {

/// @brief Convert filesystem path to UTF-8 string
[[nodiscard]] std::string pathToUtf8(const std::filesystem::path& path);

/// @brief Convert UTF-8 string to filesystem path
[[nodiscard]] std::filesystem::path utf8ToPath(std::string_view utf8);

/// @brief Make string lowercase (ASCII only)
[[nodiscard]] std::string toLowercaseAscii(std::string_view str);

/// @brief Trim whitespace from both ends of string
[[nodiscard]] std::string_view trim(std::string_view str);

/// @brief Compare two strings ignoring ASCII case
[[nodiscard]] bool equalsIcase(std::string_view a, std::string_view b);

/// @brief Join strings with a separator
[[nodiscard]] std::string join(const std::vector<std::string>& parts, std::string_view separator);

}  // namespace verinfo
