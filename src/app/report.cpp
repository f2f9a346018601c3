/// @file report.cpp
/// @brief Console report rendering implementation

#include "report.hpp"

#include <algorithm>
#include <ostream>

namespace verinfo::app {

size_t displayWidth(const std::string& utf8) noexcept {
    // Count every byte that is not a continuation byte
    return static_cast<size_t>(std::ranges::count_if(
        utf8, [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

void printSection(std::ostream& out, const InfoSection& section) {
    out << section.title << '\n';
    out << std::string(std::max<size_t>(displayWidth(section.title), 1), '-') << '\n';

    size_t width = 0;
    for (const auto& row : section.rows) {
        width = std::max(width, displayWidth(row.label));
    }

    for (const auto& row : section.rows) {
        out << row.label << std::string(width - displayWidth(row.label), ' ') << " : "
            << row.value << '\n';
    }
}

void printReport(std::ostream& out, const std::vector<InfoSection>& sections) {
    bool first = true;
    for (const auto& section : sections) {
        if (!first) {
            out << '\n';
        }
        first = false;
        printSection(out, section);
    }
}

}  // namespace verinfo::app
