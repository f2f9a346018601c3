/// @file environment_info.cpp
/// @brief Environment variables and special folders implementation

#include "environment_info.hpp"

#include "core/util/win32_utils.hpp"

#include <ShlObj.h>

#include <vector>

#include "core/util/logger.hpp"

namespace verinfo::sysinfo {

namespace {

const KNOWNFOLDERID* knownFolderId(SpecialFolder folder) noexcept {
    switch (folder) {
    case SpecialFolder::Desktop:
        return &FOLDERID_Desktop;
    case SpecialFolder::Documents:
        return &FOLDERID_Documents;
    case SpecialFolder::AppData:
        return &FOLDERID_RoamingAppData;
    case SpecialFolder::LocalAppData:
        return &FOLDERID_LocalAppData;
    case SpecialFolder::ProgramData:
        return &FOLDERID_ProgramData;
    case SpecialFolder::ProgramFiles:
        return &FOLDERID_ProgramFiles;
    case SpecialFolder::ProgramFilesX86:
        return &FOLDERID_ProgramFilesX86;
    case SpecialFolder::System:
        return &FOLDERID_System;
    case SpecialFolder::Windows:
        return &FOLDERID_Windows;
    case SpecialFolder::UserProfile:
        return &FOLDERID_Profile;
    case SpecialFolder::Startup:
        return &FOLDERID_Startup;
    case SpecialFolder::Fonts:
        return &FOLDERID_Fonts;
    case SpecialFolder::Temp:
        return nullptr;  // Not a known folder; resolved with GetTempPathW
    }
    return nullptr;
}

std::wstring tempPath() {
    std::vector<wchar_t> buffer(MAX_PATH + 1);
    DWORD length = GetTempPathW(static_cast<DWORD>(buffer.size()), buffer.data());
    if (length > buffer.size()) {
        buffer.resize(length);
        length = GetTempPathW(static_cast<DWORD>(buffer.size()), buffer.data());
    }
    if (length == 0 || length > buffer.size()) {
        return {};
    }
    return std::wstring(buffer.data(), length);
}

}  // namespace

std::string getEnvironment(std::string_view name) {
    std::wstring wide_name = utf8ToWideOrEmpty(name);
    std::string result;

    if (!wide_name.empty()) {
        DWORD size = GetEnvironmentVariableW(wide_name.c_str(), nullptr, 0);
        if (size > 0) {
            std::wstring value(size, L'\0');
            DWORD length = GetEnvironmentVariableW(wide_name.c_str(), value.data(), size);
            if (length > 0 && length < size) {
                value.resize(length);
                result = wideToUtf8OrEmpty(value);
            }
        }
    }

    LOG_DEBUG("Environment: {} variable = {}", name, result);
    return result;
}

std::string getSpecialFolder(SpecialFolder folder) {
    std::string result;

    if (const auto* id = knownFolderId(folder)) {
        wchar_t* path = nullptr;
        HRESULT hr = SHGetKnownFolderPath(*id, KF_FLAG_DEFAULT, nullptr, &path);
        if (SUCCEEDED(hr)) {
            result = wideToUtf8OrEmpty(path);
        } else {
            LOG_WARN("Special folder {} unavailable: {}", to_string(folder),
                     getHresultString(hr));
        }
        CoTaskMemFree(path);
    } else if (folder == SpecialFolder::Temp) {
        result = wideToUtf8OrEmpty(tempPath());
    }

    LOG_DEBUG("Environment: {} folder = {}", to_string(folder), result);
    return result;
}

}  // namespace verinfo::sysinfo
