/// @file value_format.hpp
/// @brief Display formatting for values returned by the system queries

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace verinfo::sysinfo {

/// @brief Returned by the system queries when a value does not exist
inline constexpr std::string_view kNoData = "no data";

/// @brief Parse a CIM DATETIME ("yyyymmddHHMMSS.mmmmmmsUUU") into UTC.
///
/// The trailing sUUU is the offset from UTC in minutes ("+060", "-300").
/// Microseconds are dropped.
/// @return Time point, or std::nullopt when the text is malformed
[[nodiscard]] std::optional<std::chrono::sys_seconds> parseCimDateTime(std::string_view text);

/// @brief Split a duration into whole days, hours and minutes
struct UptimeParts {
    int64_t days = 0;
    int64_t hours = 0;
    int64_t minutes = 0;
};

[[nodiscard]] UptimeParts splitUptime(std::chrono::seconds uptime) noexcept;

/// @brief Localized uptime text from the HardwareInfo_UptimeString resource
[[nodiscard]] std::string formatUptime(std::chrono::sys_seconds boot,
                                       std::chrono::sys_seconds now);

/// @brief Human readable size with binary units ("15.9 GB", "512 B")
[[nodiscard]] std::string formatBytes(uint64_t bytes);

/// @brief Format seconds since the Unix epoch as "YYYY-MM-DD HH:MM:SS" (UTC)
[[nodiscard]] std::string formatUnixDate(int64_t seconds);

}  // namespace verinfo::sysinfo
