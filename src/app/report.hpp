/// @file report.hpp
/// @brief Console report rendering

#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace verinfo::app {

/// @brief One "label : value" line
struct InfoRow {
    std::string label;
    std::string value;
};

/// @brief Titled group of rows
struct InfoSection {
    std::string title;
    std::vector<InfoRow> rows;

    void add(std::string label, std::string value) {
        rows.push_back({std::move(label), std::move(value)});
    }
};

/// @brief Number of code points in a UTF-8 string
[[nodiscard]] size_t displayWidth(const std::string& utf8) noexcept;

/// @brief Print a section: title, underline, then rows with labels padded to
/// the widest label in the section
void printSection(std::ostream& out, const InfoSection& section);

/// @brief Print sections separated by a blank line
void printReport(std::ostream& out, const std::vector<InfoSection>& sections);

}  // namespace verinfo::app
