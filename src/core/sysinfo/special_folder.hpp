/// @file special_folder.hpp
/// @brief Well-known folders the environment queries can resolve

#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace verinfo::sysinfo {

/// @brief Special folder identifiers
enum class SpecialFolder {
    Desktop,
    Documents,
    AppData,
    LocalAppData,
    ProgramData,
    ProgramFiles,
    ProgramFilesX86,
    System,
    Windows,
    UserProfile,
    Temp,
    Startup,
    Fonts,
};

/// @brief All special folders, in declaration order
inline constexpr std::array kAllSpecialFolders = {
    SpecialFolder::Desktop,      SpecialFolder::Documents,    SpecialFolder::AppData,
    SpecialFolder::LocalAppData, SpecialFolder::ProgramData,  SpecialFolder::ProgramFiles,
    SpecialFolder::ProgramFilesX86, SpecialFolder::System,    SpecialFolder::Windows,
    SpecialFolder::UserProfile,  SpecialFolder::Temp,         SpecialFolder::Startup,
    SpecialFolder::Fonts,
};

/// @brief Get string representation of SpecialFolder
[[nodiscard]] constexpr std::string_view to_string(SpecialFolder folder) noexcept {
    switch (folder) {
    case SpecialFolder::Desktop:
        return "Desktop";
    case SpecialFolder::Documents:
        return "Documents";
    case SpecialFolder::AppData:
        return "AppData";
    case SpecialFolder::LocalAppData:
        return "LocalAppData";
    case SpecialFolder::ProgramData:
        return "ProgramData";
    case SpecialFolder::ProgramFiles:
        return "ProgramFiles";
    case SpecialFolder::ProgramFilesX86:
        return "ProgramFilesX86";
    case SpecialFolder::System:
        return "System";
    case SpecialFolder::Windows:
        return "Windows";
    case SpecialFolder::UserProfile:
        return "UserProfile";
    case SpecialFolder::Temp:
        return "Temp";
    case SpecialFolder::Startup:
        return "Startup";
    case SpecialFolder::Fonts:
        return "Fonts";
    }
    return "Desktop";
}

/// @brief Parse SpecialFolder from its name (ASCII case-insensitive)
[[nodiscard]] std::optional<SpecialFolder> specialFolderFromString(std::string_view str) noexcept;

}  // namespace verinfo::sysinfo
