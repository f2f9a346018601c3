/// @file win32_utils.cpp
/// @brief Windows API helper utilities implementation

#include "win32_utils.hpp"

#include <ShlObj.h>

#include <format>
#include <vector>

namespace verinfo {

std::expected<std::wstring, StringError> utf8ToWide(std::string_view utf8) {
    if (utf8.empty()) {
        return std::wstring{};
    }

    // Calculate required buffer size
    int size = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, utf8.data(),
                                   static_cast<int>(utf8.size()), nullptr, 0);

    if (size <= 0) {
        DWORD error = GetLastError();
        if (error == ERROR_NO_UNICODE_TRANSLATION) {
            return std::unexpected(StringError::InvalidUtf8);
        }
        return std::unexpected(StringError::ConversionFailed);
    }

    // Perform conversion
    std::wstring result(static_cast<size_t>(size), L'\0');
    int converted = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, utf8.data(),
                                        static_cast<int>(utf8.size()), result.data(), size);

    if (converted <= 0) {
        return std::unexpected(StringError::ConversionFailed);
    }

    return result;
}

std::expected<std::string, StringError> wideToUtf8(std::wstring_view wide) {
    if (wide.empty()) {
        return std::string{};
    }

    // Calculate required buffer size
    int size = WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, wide.data(),
                                   static_cast<int>(wide.size()), nullptr, 0, nullptr, nullptr);

    if (size <= 0) {
        DWORD error = GetLastError();
        if (error == ERROR_NO_UNICODE_TRANSLATION) {
            return std::unexpected(StringError::InvalidUtf16);
        }
        return std::unexpected(StringError::ConversionFailed);
    }

    // Perform conversion
    std::string result(static_cast<size_t>(size), '\0');
    int converted =
        WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, wide.data(),
                            static_cast<int>(wide.size()), result.data(), size, nullptr, nullptr);

    if (converted <= 0) {
        return std::unexpected(StringError::ConversionFailed);
    }

    return result;
}

std::wstring utf8ToWideOrEmpty(std::string_view utf8) {
    auto result = utf8ToWide(utf8);
    return result ? *result : std::wstring{};
}

std::string wideToUtf8OrEmpty(std::wstring_view wide) {
    auto result = wideToUtf8(wide);
    return result ? *result : std::string{};
}

namespace {

// Look up a message in the system message table
std::optional<std::string> formatSystemMessage(DWORD code) {
    wchar_t* buffer = nullptr;
    DWORD length = FormatMessageW(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, code, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
        reinterpret_cast<wchar_t*>(&buffer), 0, nullptr);

    if (length == 0 || !buffer) {
        return std::nullopt;
    }

    std::wstring message(buffer, length);
    LocalFree(buffer);

    // Strip trailing CR/LF
    while (!message.empty() && (message.back() == L'\r' || message.back() == L'\n')) {
        message.pop_back();
    }

    return wideToUtf8OrEmpty(message);
}

}  // namespace

std::string getErrorString(DWORD error_code) {
    if (auto message = formatSystemMessage(error_code)) {
        return *message;
    }
    return std::format("Error {}", error_code);
}

std::string getHresultString(HRESULT hr) {
    // WMI errors (0x8004xxxx) are not in the system table
    if (auto message = formatSystemMessage(static_cast<DWORD>(hr))) {
        return *message;
    }
    return std::format("HRESULT 0x{:08X}", static_cast<unsigned>(hr));
}

std::filesystem::path getExecutablePath() {
    std::vector<wchar_t> buffer(MAX_PATH);
    while (true) {
        DWORD length =
            GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (length == 0) {
            return {};
        }
        if (length < buffer.size()) {
            return std::filesystem::path(std::wstring(buffer.data(), length));
        }
        buffer.resize(buffer.size() * 2);
    }
}

std::filesystem::path getExecutableDirectory() {
    return getExecutablePath().parent_path();
}

std::optional<std::filesystem::path> getLocalAppdataPath() {
    wchar_t* local_app_data = nullptr;
    if (FAILED(SHGetKnownFolderPath(FOLDERID_LocalAppData, 0, nullptr, &local_app_data))) {
        return std::nullopt;
    }
    std::filesystem::path path(local_app_data);
    CoTaskMemFree(local_app_data);
    return path;
}

}  // namespace verinfo
