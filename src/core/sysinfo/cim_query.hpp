/// @file cim_query.hpp
/// @brief Single-property CIM reads from root/cimv2

#pragma once

#include <string>
#include <string_view>

#include "cim_class.hpp"

namespace verinfo::sysinfo {

/// @brief Read one property of the first instance of a CIM class
/// @return The value as text, "no data" for a null value or no instance,
///         or the error message when the query fails
[[nodiscard]] std::string cimQuery(CimClass cls, std::string_view property);

/// @brief Get CIM value from Win32_OperatingSystem
[[nodiscard]] inline std::string cimQueryOS(std::string_view property) {
    return cimQuery(CimClass::OperatingSystem, property);
}

/// @brief Get CIM value from Win32_ComputerSystem
[[nodiscard]] inline std::string cimQuerySys(std::string_view property) {
    return cimQuery(CimClass::ComputerSystem, property);
}

/// @brief Get CIM value from Win32_Processor
[[nodiscard]] inline std::string cimQueryProc(std::string_view property) {
    return cimQuery(CimClass::Processor, property);
}

}  // namespace verinfo::sysinfo
