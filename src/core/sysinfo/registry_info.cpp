/// @file registry_info.cpp
/// @brief Registry queries implementation

#include "registry_info.hpp"

#include <cstring>
#include <expected>
#include <format>
#include <optional>
#include <vector>

#include "core/util/logger.hpp"
#include "core/util/string_utils.hpp"
#include "core/util/win32_utils.hpp"

namespace verinfo::sysinfo {

namespace {

constexpr wchar_t kCurrentVersionKey[] = L"Software\\Microsoft\\Windows NT\\CurrentVersion";

struct RegistryData {
    DWORD type = REG_NONE;
    std::vector<uint8_t> bytes;
};

// Read raw value data; nullopt when the value does not exist
std::expected<std::optional<RegistryData>, DWORD> queryValue(HKEY key, const std::wstring& name) {
    RegistryData data;
    DWORD size = 0;

    LSTATUS status = RegQueryValueExW(key, name.c_str(), nullptr, &data.type, nullptr, &size);
    // The value may grow between the two calls
    while (status == ERROR_SUCCESS || status == ERROR_MORE_DATA) {
        data.bytes.resize(size);
        status = RegQueryValueExW(key, name.c_str(), nullptr, &data.type,
                                  data.bytes.empty() ? nullptr : data.bytes.data(), &size);
        if (status == ERROR_SUCCESS) {
            data.bytes.resize(size);
            return data;
        }
    }

    if (status == ERROR_FILE_NOT_FOUND) {
        return std::nullopt;
    }
    return std::unexpected(static_cast<DWORD>(status));
}

// UTF-16 text from registry bytes, without trailing terminators
std::wstring wideFromBytes(std::span<const uint8_t> data) {
    std::wstring text(data.size() / sizeof(wchar_t), L'\0');
    if (!text.empty()) {
        std::memcpy(text.data(), data.data(), text.size() * sizeof(wchar_t));
    }
    while (!text.empty() && text.back() == L'\0') {
        text.pop_back();
    }
    return text;
}

}  // namespace

std::string formatRegistryData(DWORD type, std::span<const uint8_t> data) {
    switch (type) {
    case REG_SZ:
    case REG_EXPAND_SZ:
        return wideToUtf8OrEmpty(wideFromBytes(data));

    case REG_DWORD:
        if (data.size() >= sizeof(DWORD)) {
            DWORD value = 0;
            std::memcpy(&value, data.data(), sizeof(value));
            return std::to_string(value);
        }
        break;

    case REG_QWORD:
        if (data.size() >= sizeof(uint64_t)) {
            uint64_t value = 0;
            std::memcpy(&value, data.data(), sizeof(value));
            return std::to_string(value);
        }
        break;

    case REG_MULTI_SZ: {
        std::vector<std::string> parts;
        std::wstring all = wideFromBytes(data);
        size_t start = 0;
        while (start < all.size()) {
            size_t end = all.find(L'\0', start);
            if (end == std::wstring::npos) {
                end = all.size();
            }
            parts.push_back(wideToUtf8OrEmpty(std::wstring_view(all).substr(start, end - start)));
            start = end + 1;
        }
        return join(parts, ", ");
    }

    default:
        break;
    }

    std::string hex;
    for (size_t i = 0; i < data.size(); ++i) {
        if (i > 0) {
            hex += ' ';
        }
        hex += std::format("{:02X}", data[i]);
    }
    return hex;
}

std::string getRegistryInfo(std::string_view value) {
    RegistryKey key;
    LSTATUS status = RegOpenKeyExW(HKEY_LOCAL_MACHINE, kCurrentVersionKey, 0,
                                   KEY_QUERY_VALUE | KEY_WOW64_64KEY, key.put());
    if (status != ERROR_SUCCESS) {
        std::string message = getErrorString(static_cast<DWORD>(status));
        LOG_ERROR("Registry call failed. {}", message);
        return message;
    }

    auto wide_name = utf8ToWide(value);
    if (!wide_name) {
        std::string message(to_string(wide_name.error()));
        LOG_ERROR("Registry call failed. {}", message);
        return message;
    }

    auto data = queryValue(key.get(), *wide_name);
    if (!data) {
        std::string message = getErrorString(data.error());
        LOG_ERROR("Registry call failed. {}", message);
        return message;
    }

    std::string result = data->has_value()
                             ? formatRegistryData((*data)->type, (*data)->bytes)
                             : std::string(kNoData);
    LOG_DEBUG("Registry: {} = {}", value, result);
    return result;
}

}  // namespace verinfo::sysinfo
