/// @file resource_dictionary.hpp
/// @brief XAML string tables (one per culture)

#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace verinfo::i18n {

/// @brief Errors raised while loading a string table
enum class ResourceError {
    FileNotFound,
    IoError,
    ParseError,
    InvalidRoot,
    DuplicateKey,
};

/// @brief Get string representation of ResourceError
[[nodiscard]] constexpr std::string_view to_string(ResourceError error) noexcept {
    switch (error) {
    case ResourceError::FileNotFound:
        return "String table not found";
    case ResourceError::IoError:
        return "I/O error reading string table";
    case ResourceError::ParseError:
        return "String table is not well-formed XML";
    case ResourceError::InvalidRoot:
        return "String table root is not a ResourceDictionary";
    case ResourceError::DuplicateKey:
        return "String table defines a key more than once";
    }
    return "Unknown string table error";
}

/// @brief A culture's string table loaded from a XAML ResourceDictionary.
///
/// Every child element of the root carrying an x:Key attribute is one entry:
///   <system:String x:Key="MsgText_Error_Caption">Error</system:String>
///
/// The "x" prefix is whatever the root binds to the XAML language namespace.
/// Values are stored as UTF-8.
class ResourceDictionary {
public:
    /// @brief Load a string table from a .xaml file
    [[nodiscard]] static std::expected<ResourceDictionary, ResourceError> load(
        const std::filesystem::path& path);

    /// @brief Parse a string table from XAML text
    [[nodiscard]] static std::expected<ResourceDictionary, ResourceError> parse(
        std::string_view xaml);

    /// @brief Look up a value by key
    /// @return Pointer to the value, or nullptr if not found
    [[nodiscard]] const std::string* find(std::string_view key) const;

    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    /// @brief Number of keyed entries
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// @brief All keys in ordinal order
    [[nodiscard]] std::vector<std::string> keys() const;

    /// @brief Source file, empty when parsed from memory
    [[nodiscard]] const std::filesystem::path& source() const noexcept { return source_; }

private:
    std::map<std::string, std::string, std::less<>> entries_;
    std::filesystem::path source_;
};

/// @brief Path of the string table for a culture: <dir>/Strings.<culture>.xaml
[[nodiscard]] std::filesystem::path dictionaryPath(const std::filesystem::path& languages_dir,
                                                   std::string_view culture);

/// @brief List cultures that have a string table in the directory
/// @return Sorted culture tags
[[nodiscard]] std::vector<std::string> listAvailableCultures(
    const std::filesystem::path& languages_dir);

}  // namespace verinfo::i18n
