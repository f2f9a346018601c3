/// @file environment_info.hpp
/// @brief Environment variables and special folders

#pragma once

#include <string>
#include <string_view>

#include "special_folder.hpp"

namespace verinfo::sysinfo {

/// @brief Get an environment variable of the current process
/// @return The value, or an empty string when it is not set
[[nodiscard]] std::string getEnvironment(std::string_view name);

/// @brief Get the path of a special folder
/// @return The path as UTF-8, or an empty string when it is unavailable
[[nodiscard]] std::string getSpecialFolder(SpecialFolder folder);

}  // namespace verinfo::sysinfo
