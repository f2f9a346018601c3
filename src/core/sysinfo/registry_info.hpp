/// @file registry_info.hpp
/// @brief Values under HKLM\Software\Microsoft\Windows NT\CurrentVersion

#pragma once

#ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
#endif

#include <Windows.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "value_format.hpp"

namespace verinfo::sysinfo {

/// @brief Read a value from HKLM\Software\Microsoft\Windows NT\CurrentVersion
/// @param value Value name (e.g. "ProductName", "DisplayVersion")
/// @return The value as text, "no data" if it does not exist, or the system
///         error message if the key cannot be read
[[nodiscard]] std::string getRegistryInfo(std::string_view value);

/// @brief Render raw registry data as text
///
/// REG_SZ / REG_EXPAND_SZ verbatim, REG_DWORD / REG_QWORD decimal,
/// REG_MULTI_SZ joined with ", ", anything else as space separated hex bytes.
[[nodiscard]] std::string formatRegistryData(DWORD type, std::span<const uint8_t> data);

}  // namespace verinfo::sysinfo
