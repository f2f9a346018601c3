/// @file cim_class.hpp
/// @brief CIM classes verinfo queries and WQL construction

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace verinfo::sysinfo {

/// @brief CIM classes under root/cimv2 that verinfo reads from
enum class CimClass {
    OperatingSystem,  // Win32_OperatingSystem
    ComputerSystem,   // Win32_ComputerSystem
    Processor,        // Win32_Processor
};

/// @brief WMI class name for a CimClass
[[nodiscard]] constexpr std::string_view to_string(CimClass cls) noexcept {
    switch (cls) {
    case CimClass::OperatingSystem:
        return "Win32_OperatingSystem";
    case CimClass::ComputerSystem:
        return "Win32_ComputerSystem";
    case CimClass::Processor:
        return "Win32_Processor";
    }
    return "Win32_OperatingSystem";
}

/// @brief Parse the short names used on the command line ("os", "sys", "proc")
[[nodiscard]] std::optional<CimClass> cimClassFromString(std::string_view str) noexcept;

/// @brief Check that a property name is a plain WQL identifier
/// (ASCII letters, digits and underscore, not starting with a digit)
[[nodiscard]] bool isValidPropertyName(std::string_view property) noexcept;

/// @brief Build "SELECT <property> FROM <class>"
/// @return The query, or std::nullopt if the property name is not an identifier
[[nodiscard]] std::optional<std::string> buildSelectQuery(CimClass cls,
                                                          std::string_view property);

}  // namespace verinfo::sysinfo
