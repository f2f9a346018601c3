/// @file special_folder.cpp
/// @brief Special folder name parsing

#include "special_folder.hpp"

#include "core/util/string_utils.hpp"

namespace verinfo::sysinfo {

std::optional<SpecialFolder> specialFolderFromString(std::string_view str) noexcept {
    for (auto folder : kAllSpecialFolders) {
        if (equalsIcase(str, to_string(folder))) {
            return folder;
        }
    }
    return std::nullopt;
}

}  // namespace verinfo::sysinfo
