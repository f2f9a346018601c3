/// @file win32_utils.hpp
/// @brief Windows API helper utilities
///
/// Provides RAII wrappers and helper functions for common Windows API patterns.

#pragma once

#ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
#endif

#include <Windows.h>

#include <objbase.h>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace verinfo {

/// @brief String conversion errors
enum class StringError {
    InvalidUtf8,
    InvalidUtf16,
    ConversionFailed,
};

/// @brief Get string representation of string error
[[nodiscard]] constexpr std::string_view to_string(StringError error) noexcept {
    switch (error) {
    case StringError::InvalidUtf8:
        return "Invalid UTF-8 sequence";
    case StringError::InvalidUtf16:
        return "Invalid UTF-16 sequence";
    case StringError::ConversionFailed:
        return "String conversion failed";
    }
    return "Unknown string error";
}

/// @brief Convert UTF-8 string to UTF-16 (wide string)
[[nodiscard]] std::expected<std::wstring, StringError> utf8ToWide(std::string_view utf8);

/// @brief Convert UTF-16 (wide string) to UTF-8
[[nodiscard]] std::expected<std::string, StringError> wideToUtf8(std::wstring_view wide);

/// @brief Convert UTF-8 to wide string, or empty string on error
[[nodiscard]] std::wstring utf8ToWideOrEmpty(std::string_view utf8);

/// @brief Convert wide string to UTF-8, or empty string on error
[[nodiscard]] std::string wideToUtf8OrEmpty(std::wstring_view wide);

/// @brief RAII wrapper for COM initialization
///
/// Usage:
///   ComInitializer com(COINIT_MULTITHREADED);
///   if (!com) { handle error }
///
/// RPC_E_CHANGED_MODE (COM already initialized with another model on this
/// thread) counts as success but is not balanced with CoUninitialize.
class ComInitializer {
public:
    explicit ComInitializer(DWORD flags = COINIT_APARTMENTTHREADED) {
        hr_ = CoInitializeEx(nullptr, flags);
    }

    ~ComInitializer() {
        if (SUCCEEDED(hr_)) {
            CoUninitialize();
        }
    }

    // Non-copyable, non-movable
    ComInitializer(const ComInitializer&) = delete;
    ComInitializer& operator=(const ComInitializer&) = delete;
    ComInitializer(ComInitializer&&) = delete;
    ComInitializer& operator=(ComInitializer&&) = delete;

    [[nodiscard]] bool succeeded() const noexcept {
        return SUCCEEDED(hr_) || hr_ == RPC_E_CHANGED_MODE;
    }

    [[nodiscard]] explicit operator bool() const noexcept { return succeeded(); }

    [[nodiscard]] HRESULT result() const noexcept { return hr_; }

private:
    HRESULT hr_;
};

/// @brief RAII wrapper for an open registry key
class RegistryKey {
public:
    RegistryKey() = default;
    explicit RegistryKey(HKEY key) : key_(key) {}

    ~RegistryKey() { close(); }

    // Non-copyable
    RegistryKey(const RegistryKey&) = delete;
    RegistryKey& operator=(const RegistryKey&) = delete;

    // Movable
    RegistryKey(RegistryKey&& other) noexcept : key_(other.key_) { other.key_ = nullptr; }

    RegistryKey& operator=(RegistryKey&& other) noexcept {
        if (this != &other) {
            close();
            key_ = other.key_;
            other.key_ = nullptr;
        }
        return *this;
    }

    void close() noexcept {
        if (key_) {
            RegCloseKey(key_);
            key_ = nullptr;
        }
    }

    [[nodiscard]] HKEY get() const noexcept { return key_; }

    [[nodiscard]] HKEY* put() noexcept {
        close();
        return &key_;
    }

    [[nodiscard]] explicit operator bool() const noexcept { return key_ != nullptr; }

private:
    HKEY key_ = nullptr;
};

/// @brief Get error string for specific error code
[[nodiscard]] std::string getErrorString(DWORD error_code);

/// @brief Get error string for an HRESULT (falls back to the hex code)
[[nodiscard]] std::string getHresultString(HRESULT hr);

/// @brief Get the path to the executable
[[nodiscard]] std::filesystem::path getExecutablePath();

/// @brief Get the directory containing the executable
[[nodiscard]] std::filesystem::path getExecutableDirectory();

/// @brief Get %LOCALAPPDATA% path
[[nodiscard]] std::optional<std::filesystem::path> getLocalAppdataPath();

}  // namespace verinfo
