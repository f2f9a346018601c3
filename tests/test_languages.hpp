/// @file test_languages.hpp
/// @brief Temporary string table directories for tests

#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace verinfo::test {

/// @brief XAML text of a string table with the given entries
inline std::string makeXaml(const std::vector<std::pair<std::string, std::string>>& entries) {
    std::string xaml =
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<ResourceDictionary "
        "xmlns=\"http://schemas.microsoft.com/winfx/2006/xaml/presentation\"\n"
        "                    xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\"\n"
        "                    xmlns:system=\"clr-namespace:System;assembly=mscorlib\">\n";
    for (const auto& [key, value] : entries) {
        xaml += "    <system:String x:Key=\"" + key + "\">" + value + "</system:String>\n";
    }
    xaml += "</ResourceDictionary>\n";
    return xaml;
}

/// @brief Directory under the system temp path, removed on destruction
class TempDirectory {
public:
    explicit TempDirectory(std::string_view name) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                (std::string("verinfo_") + std::string(name) + "_" + std::to_string(stamp));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    void writeFile(const std::filesystem::path& name, std::string_view content) const {
        std::ofstream file(path_ / name, std::ios::binary);
        file << content;
    }

    void writeTable(std::string_view culture,
                    const std::vector<std::pair<std::string, std::string>>& entries) const {
        writeFile("Strings." + std::string(culture) + ".xaml", makeXaml(entries));
    }

private:
    std::filesystem::path path_;
};

}  // namespace verinfo::test
