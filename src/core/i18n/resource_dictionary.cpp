/// @file resource_dictionary.cpp
/// @brief XAML string table loading using pugixml

#include "resource_dictionary.hpp"

#include <algorithm>

#include <pugixml.hpp>

#include "core/util/result.hpp"
#include "core/util/string_utils.hpp"

namespace verinfo::i18n {

namespace {

constexpr std::string_view kXamlNamespace = "http://schemas.microsoft.com/winfx/2006/xaml";
constexpr std::string_view kRootName = "ResourceDictionary";
constexpr std::string_view kFilePrefix = "Strings.";
constexpr std::string_view kFileExtension = ".xaml";

// Local name of a possibly prefixed element name
std::string_view localName(const char* name) {
    std::string_view view(name);
    auto pos = view.find(':');
    return pos == std::string_view::npos ? view : view.substr(pos + 1);
}

// Prefix the root binds to the XAML language namespace ("x" by convention)
std::string xamlPrefix(const pugi::xml_node& root) {
    for (const auto& attr : root.attributes()) {
        std::string_view name(attr.name());
        if (name.starts_with("xmlns:") && kXamlNamespace == attr.value()) {
            return std::string(name.substr(6));
        }
    }
    return "x";
}

// All direct text and CDATA of an element, in document order
std::string elementText(const pugi::xml_node& element) {
    std::string text;
    for (const auto& node : element.children()) {
        if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) {
            text += node.value();
        }
    }
    return text;
}

// Collect keyed entries below the ResourceDictionary root
std::expected<void, ResourceError> collectEntries(
    const pugi::xml_document& doc, std::map<std::string, std::string, std::less<>>& entries) {
    auto root = doc.document_element();
    if (!root || localName(root.name()) != kRootName) {
        return std::unexpected(ResourceError::InvalidRoot);
    }

    const std::string key_attribute = xamlPrefix(root) + ":Key";

    for (const auto& child : root.children()) {
        if (child.type() != pugi::node_element) {
            continue;
        }
        auto key = child.attribute(key_attribute.c_str());
        if (!key) {
            continue;
        }
        auto [it, inserted] = entries.emplace(key.value(), elementText(child));
        if (!inserted) {
            return std::unexpected(ResourceError::DuplicateKey);
        }
    }

    return {};
}

}  // namespace

std::expected<ResourceDictionary, ResourceError> ResourceDictionary::load(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return makeError(ResourceError::FileNotFound);
    }

    pugi::xml_document doc;
    auto result = doc.load_file(path.c_str());
    switch (result.status) {
    case pugi::status_ok:
        break;
    case pugi::status_file_not_found:
        return std::unexpected(ResourceError::FileNotFound);
    case pugi::status_io_error:
    case pugi::status_out_of_memory:
        return std::unexpected(ResourceError::IoError);
    default:
        return std::unexpected(ResourceError::ParseError);
    }

    ResourceDictionary dictionary;
    VERINFO_TRY_VOID(collectEntries(doc, dictionary.entries_));
    dictionary.source_ = path;
    return dictionary;
}

std::expected<ResourceDictionary, ResourceError> ResourceDictionary::parse(
    std::string_view xaml) {
    pugi::xml_document doc;
    auto result = doc.load_buffer(xaml.data(), xaml.size());
    if (!result) {
        return std::unexpected(ResourceError::ParseError);
    }

    ResourceDictionary dictionary;
    VERINFO_TRY_VOID(collectEntries(doc, dictionary.entries_));
    return dictionary;
}

const std::string* ResourceDictionary::find(std::string_view key) const {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::vector<std::string> ResourceDictionary::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, value] : entries_) {
        result.push_back(key);
    }
    return result;
}

std::filesystem::path dictionaryPath(const std::filesystem::path& languages_dir,
                                     std::string_view culture) {
    std::string file_name(kFilePrefix);
    file_name += culture;
    file_name += kFileExtension;
    return languages_dir / utf8ToPath(file_name);
}

std::vector<std::string> listAvailableCultures(const std::filesystem::path& languages_dir) {
    std::vector<std::string> cultures;

    std::error_code ec;
    if (!std::filesystem::exists(languages_dir, ec)) {
        return cultures;
    }

    for (const auto& entry : std::filesystem::directory_iterator(languages_dir, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        std::string name = pathToUtf8(entry.path().filename());
        if (name.size() > kFilePrefix.size() + kFileExtension.size() &&
            name.starts_with(kFilePrefix) && name.ends_with(kFileExtension)) {
            cultures.push_back(name.substr(
                kFilePrefix.size(), name.size() - kFilePrefix.size() - kFileExtension.size()));
        }
    }

    std::sort(cultures.begin(), cultures.end());
    return cultures;
}

}  // namespace verinfo::i18n
