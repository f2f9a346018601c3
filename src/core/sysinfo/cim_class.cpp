/// @file cim_class.cpp
/// @brief CIM class names and WQL construction

#include "cim_class.hpp"

#include <format>

#include "core/util/string_utils.hpp"

namespace verinfo::sysinfo {

namespace {

constexpr bool isAsciiAlpha(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

constexpr bool isAsciiDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

}  // namespace

std::optional<CimClass> cimClassFromString(std::string_view str) noexcept {
    if (equalsIcase(str, "os") || equalsIcase(str, to_string(CimClass::OperatingSystem)))
        return CimClass::OperatingSystem;
    if (equalsIcase(str, "sys") || equalsIcase(str, to_string(CimClass::ComputerSystem)))
        return CimClass::ComputerSystem;
    if (equalsIcase(str, "proc") || equalsIcase(str, to_string(CimClass::Processor)))
        return CimClass::Processor;
    return std::nullopt;
}

bool isValidPropertyName(std::string_view property) noexcept {
    if (property.empty() || isAsciiDigit(property.front())) {
        return false;
    }
    for (char c : property) {
        if (!isAsciiAlpha(c) && !isAsciiDigit(c) && c != '_') {
            return false;
        }
    }
    return true;
}

std::optional<std::string> buildSelectQuery(CimClass cls, std::string_view property) {
    if (!isValidPropertyName(property)) {
        return std::nullopt;
    }
    return std::format("SELECT {} FROM {}", property, to_string(cls));
}

}  // namespace verinfo::sysinfo
