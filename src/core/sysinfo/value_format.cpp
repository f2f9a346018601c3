/// @file value_format.cpp
/// @brief Display formatting for values returned by the system queries

#include "value_format.hpp"

#include <array>
#include <charconv>
#include <format>

#include "core/i18n/i18n.hpp"

namespace verinfo::sysinfo {

namespace {

// Parse a fixed-width run of decimal digits
template <typename T>
bool parseDigits(std::string_view text, size_t offset, size_t count, T& out) {
    if (offset + count > text.size()) {
        return false;
    }
    auto field = text.substr(offset, count);
    for (char c : field) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), out);
    return ec == std::errc{} && ptr == field.data() + field.size();
}

}  // namespace

std::optional<std::chrono::sys_seconds> parseCimDateTime(std::string_view text) {
    using namespace std::chrono;

    // yyyymmddHHMMSS.mmmmmmsUUU
    constexpr size_t kLength = 25;
    if (text.size() != kLength || text[14] != '.' || (text[21] != '+' && text[21] != '-')) {
        return std::nullopt;
    }

    int year_value = 0;
    unsigned month_value = 0, day_value = 0;
    int hour = 0, minute = 0, second = 0, offset = 0;
    if (!parseDigits(text, 0, 4, year_value) || !parseDigits(text, 4, 2, month_value) ||
        !parseDigits(text, 6, 2, day_value) || !parseDigits(text, 8, 2, hour) ||
        !parseDigits(text, 10, 2, minute) || !parseDigits(text, 12, 2, second) ||
        !parseDigits(text, 22, 3, offset)) {
        return std::nullopt;
    }

    year_month_day date{year{year_value}, month{month_value}, day{day_value}};
    if (!date.ok() || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    auto local = sys_days{date} + hours{hour} + minutes{minute} + seconds{second};
    // Local time = UTC + offset
    auto utc_offset = minutes{text[21] == '-' ? -offset : offset};
    return local - utc_offset;
}

UptimeParts splitUptime(std::chrono::seconds uptime) noexcept {
    using namespace std::chrono;

    if (uptime.count() < 0) {
        uptime = seconds{0};
    }
    UptimeParts parts;
    parts.days = duration_cast<days>(uptime).count();
    uptime -= days{parts.days};
    parts.hours = duration_cast<hours>(uptime).count();
    uptime -= hours{parts.hours};
    parts.minutes = duration_cast<minutes>(uptime).count();
    return parts;
}

std::string formatUptime(std::chrono::sys_seconds boot, std::chrono::sys_seconds now) {
    auto parts = splitUptime(now - boot);
    return i18n::compositeResource("HardwareInfo_UptimeString")
        .format({std::to_string(parts.days), std::to_string(parts.hours),
                 std::to_string(parts.minutes)});
}

std::string formatBytes(uint64_t bytes) {
    constexpr std::array<std::string_view, 5> kUnits = {"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) {
        return std::format("{} B", bytes);
    }

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    return std::format("{:.1f} {}", value, kUnits[unit]);
}

std::string formatUnixDate(int64_t seconds) {
    using namespace std::chrono;
    sys_seconds tp{std::chrono::seconds{seconds}};
    return std::format("{:%Y-%m-%d %H:%M:%S}", tp);
}

}  // namespace verinfo::sysinfo
