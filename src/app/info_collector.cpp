/// @file info_collector.cpp
/// @brief Builds report sections from the system queries

#include "info_collector.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include "core/i18n/i18n.hpp"
#include "core/sysinfo/cim_query.hpp"
#include "core/sysinfo/environment_info.hpp"
#include "core/sysinfo/registry_info.hpp"
#include "core/sysinfo/value_format.hpp"
#include "core/util/logger.hpp"

namespace verinfo::app {

namespace {

using i18n::getStringResource;

// Query results are either a value or an error text; only digits parse
template <typename T>
std::optional<T> parseNumber(std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string installDate() {
    auto raw = sysinfo::getRegistryInfo("InstallDate");
    if (auto seconds = parseNumber<int64_t>(raw)) {
        return sysinfo::formatUnixDate(*seconds);
    }
    return raw;
}

std::string buildNumber() {
    auto build = sysinfo::getRegistryInfo("CurrentBuild");
    auto ubr = sysinfo::getRegistryInfo("UBR");
    if (parseNumber<uint32_t>(ubr)) {
        return std::format("{}.{}", build, ubr);
    }
    return build;
}

std::string uptime() {
    auto raw = sysinfo::cimQueryOS("LastBootUpTime");
    auto boot = sysinfo::parseCimDateTime(raw);
    if (!boot) {
        return raw;
    }
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return sysinfo::formatUptime(*boot, now);
}

std::string totalMemory() {
    auto raw = sysinfo::cimQuerySys("TotalPhysicalMemory");
    if (auto bytes = parseNumber<uint64_t>(raw)) {
        return sysinfo::formatBytes(*bytes);
    }
    return raw;
}

std::string clockSpeed() {
    auto raw = sysinfo::cimQueryProc("MaxClockSpeed");
    if (parseNumber<uint32_t>(raw)) {
        return std::format("{} MHz", raw);
    }
    return raw;
}

}  // namespace

InfoSection collectOperatingSystem() {
    InfoSection section{getStringResource("OsInfo_Title"), {}};

    section.add(getStringResource("OsInfo_ProductName"), sysinfo::getRegistryInfo("ProductName"));
    section.add(getStringResource("OsInfo_Caption"), sysinfo::cimQueryOS("Caption"));
    section.add(getStringResource("OsInfo_DisplayVersion"),
                sysinfo::getRegistryInfo("DisplayVersion"));
    section.add(getStringResource("OsInfo_Version"), sysinfo::cimQueryOS("Version"));
    section.add(getStringResource("OsInfo_Build"), buildNumber());
    section.add(getStringResource("OsInfo_Edition"), sysinfo::getRegistryInfo("EditionID"));
    section.add(getStringResource("OsInfo_Architecture"), sysinfo::cimQueryOS("OSArchitecture"));
    section.add(getStringResource("OsInfo_RegisteredOwner"),
                sysinfo::getRegistryInfo("RegisteredOwner"));
    section.add(getStringResource("OsInfo_InstallDate"), installDate());
    section.add(getStringResource("HardwareInfo_Uptime"), uptime());

    return section;
}

InfoSection collectHardware() {
    InfoSection section{getStringResource("HardwareInfo_Title"), {}};

    section.add(getStringResource("HardwareInfo_Manufacturer"),
                sysinfo::cimQuerySys("Manufacturer"));
    section.add(getStringResource("HardwareInfo_Model"), sysinfo::cimQuerySys("Model"));
    section.add(getStringResource("HardwareInfo_SystemType"), sysinfo::cimQuerySys("SystemType"));
    section.add(getStringResource("HardwareInfo_Memory"), totalMemory());
    section.add(getStringResource("HardwareInfo_Processor"), sysinfo::cimQueryProc("Name"));
    section.add(getStringResource("HardwareInfo_Cores"), sysinfo::cimQueryProc("NumberOfCores"));
    section.add(getStringResource("HardwareInfo_LogicalProcessors"),
                sysinfo::cimQueryProc("NumberOfLogicalProcessors"));
    section.add(getStringResource("HardwareInfo_ClockSpeed"), clockSpeed());

    return section;
}

InfoSection collectEnvironment() {
    InfoSection section{getStringResource("EnvironmentInfo_Title"), {}};

    section.add(getStringResource("EnvironmentInfo_ComputerName"),
                sysinfo::getEnvironment("COMPUTERNAME"));
    section.add(getStringResource("EnvironmentInfo_UserName"), sysinfo::getEnvironment("USERNAME"));
    section.add(getStringResource("EnvironmentInfo_UserDomain"),
                sysinfo::getEnvironment("USERDOMAIN"));

    for (auto folder : sysinfo::kAllSpecialFolders) {
        auto path = sysinfo::getSpecialFolder(folder);
        section.add(std::string(sysinfo::to_string(folder)),
                    path.empty() ? std::string(sysinfo::kNoData) : path);
    }

    return section;
}

std::vector<InfoSection> collectSections(Section section) {
    std::vector<InfoSection> sections;

    if (section == Section::All || section == Section::OperatingSystem) {
        sections.push_back(collectOperatingSystem());
    }
    if (section == Section::All || section == Section::Hardware) {
        sections.push_back(collectHardware());
    }
    if (section == Section::All || section == Section::Environment) {
        sections.push_back(collectEnvironment());
    }

    LOG_DEBUG("Collected {} report section(s)", sections.size());
    return sections;
}

}  // namespace verinfo::app
