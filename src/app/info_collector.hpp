/// @file info_collector.hpp
/// @brief Builds report sections from the system queries

#pragma once

#include <vector>

#include "command_line.hpp"
#include "report.hpp"

namespace verinfo::app {

/// @brief Operating system: product, version, build, edition, owner, install date, uptime
[[nodiscard]] InfoSection collectOperatingSystem();

/// @brief Computer system and processor
[[nodiscard]] InfoSection collectHardware();

/// @brief Machine and user names plus the special folders
[[nodiscard]] InfoSection collectEnvironment();

/// @brief Sections selected on the command line, in report order
[[nodiscard]] std::vector<InfoSection> collectSections(Section section);

}  // namespace verinfo::app
