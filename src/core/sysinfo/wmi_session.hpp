/// @file wmi_session.hpp
/// @brief RAII connection to the WMI service (root/cimv2)

#pragma once

#ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
#endif

#include <Windows.h>

#include <Wbemidl.h>
#include <wrl/client.h>

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "core/util/win32_utils.hpp"

namespace verinfo::sysinfo {

using Microsoft::WRL::ComPtr;

/// @brief Stage at which a WMI call failed
enum class WmiStage {
    ComInitialization,
    CreateLocator,
    ConnectServer,
    ProxyBlanket,
    ExecQuery,
    NextInstance,
    GetProperty,
    InvalidProperty,
};

/// @brief Get string representation of WmiStage
[[nodiscard]] constexpr std::string_view to_string(WmiStage stage) noexcept {
    switch (stage) {
    case WmiStage::ComInitialization:
        return "COM initialization failed";
    case WmiStage::CreateLocator:
        return "Cannot create WMI locator";
    case WmiStage::ConnectServer:
        return "Cannot connect to WMI namespace";
    case WmiStage::ProxyBlanket:
        return "Cannot set WMI proxy security";
    case WmiStage::ExecQuery:
        return "WMI query failed";
    case WmiStage::NextInstance:
        return "Cannot read WMI query result";
    case WmiStage::GetProperty:
        return "Cannot read WMI property";
    case WmiStage::InvalidProperty:
        return "Invalid property name";
    }
    return "WMI error";
}

/// @brief A WMI failure with the HRESULT that caused it
struct WmiError {
    WmiStage stage;
    HRESULT hr = S_OK;

    /// @brief "<stage>: <system message>"
    [[nodiscard]] std::string message() const;
};

/// @brief Connection to a WMI namespace.
///
/// Initializes COM for the calling thread for the lifetime of the session.
/// Sessions are cheap enough to create per query.
class WmiSession {
public:
    /// @brief Connect to a namespace (default ROOT\CIMV2)
    [[nodiscard]] static std::expected<WmiSession, WmiError> connect(
        std::wstring_view wmi_namespace = L"ROOT\\CIMV2");

    WmiSession(WmiSession&&) noexcept = default;
    WmiSession& operator=(WmiSession&&) noexcept = default;
    WmiSession(const WmiSession&) = delete;
    WmiSession& operator=(const WmiSession&) = delete;

    /// @brief Run a WQL query and read one property of the first instance
    /// @return The value as text, std::nullopt for no instance or a null value
    [[nodiscard]] std::expected<std::optional<std::string>, WmiError> queryFirst(
        std::string_view wql, std::string_view property) const;

private:
    WmiSession() = default;

    // Declared first so COM is uninitialized after the proxies are released
    std::unique_ptr<ComInitializer> com_;
    ComPtr<IWbemLocator> locator_;
    ComPtr<IWbemServices> services_;
};

/// @brief Render a VARIANT as text (strings, integers, booleans, arrays)
/// @return std::nullopt for VT_NULL / VT_EMPTY
[[nodiscard]] std::optional<std::string> variantToString(const VARIANT& value);

}  // namespace verinfo::sysinfo
