/// @file wmi_session.cpp
/// @brief WMI connection and property reads

#include "wmi_session.hpp"

#include <comdef.h>

#include <format>
#include <vector>

#include "core/util/string_utils.hpp"

#pragma comment(lib, "wbemuuid.lib")

namespace verinfo::sysinfo {

namespace {

// RAII VARIANT
class Variant {
public:
    Variant() { VariantInit(&value_); }
    ~Variant() { VariantClear(&value_); }

    Variant(const Variant&) = delete;
    Variant& operator=(const Variant&) = delete;

    [[nodiscard]] VARIANT* put() noexcept { return &value_; }
    [[nodiscard]] const VARIANT& get() const noexcept { return value_; }

private:
    VARIANT value_;
};

std::string bstrToUtf8(BSTR value) {
    if (!value) {
        return {};
    }
    return wideToUtf8OrEmpty(std::wstring_view(value, SysStringLen(value)));
}

// Scalar element of a SAFEARRAY, rendered through a temporary VARIANT
std::optional<std::string> arrayElementToString(SAFEARRAY* array, VARTYPE type, LONG index) {
    Variant element;
    VARIANT* out = element.put();

    HRESULT hr = E_FAIL;
    if (type == VT_BSTR) {
        BSTR item = nullptr;
        hr = SafeArrayGetElement(array, &index, &item);
        if (SUCCEEDED(hr)) {
            out->vt = VT_BSTR;
            out->bstrVal = item;  // Owned by the VARIANT from here on
        }
    } else if (type == VT_VARIANT) {
        hr = SafeArrayGetElement(array, &index, out);
    } else {
        // Scalars fit in the VARIANT union
        hr = SafeArrayGetElement(array, &index, &out->llVal);
        if (SUCCEEDED(hr)) {
            out->vt = type;
        }
    }

    if (FAILED(hr)) {
        return std::nullopt;
    }
    return variantToString(element.get());
}

}  // namespace

std::string WmiError::message() const {
    return std::format("{}: {}", to_string(stage), getHresultString(hr));
}

std::optional<std::string> variantToString(const VARIANT& value) {
    if (value.vt == VT_NULL || value.vt == VT_EMPTY) {
        return std::nullopt;
    }

    if (value.vt & VT_ARRAY) {
        SAFEARRAY* array = value.parray;
        if (!array || SafeArrayGetDim(array) != 1) {
            return std::nullopt;
        }
        LONG lower = 0, upper = -1;
        if (FAILED(SafeArrayGetLBound(array, 1, &lower)) ||
            FAILED(SafeArrayGetUBound(array, 1, &upper))) {
            return std::nullopt;
        }
        VARTYPE type = static_cast<VARTYPE>(value.vt & VT_TYPEMASK);
        std::vector<std::string> items;
        for (LONG i = lower; i <= upper; ++i) {
            if (auto item = arrayElementToString(array, type, i)) {
                items.push_back(std::move(*item));
            }
        }
        return join(items, ", ");
    }

    switch (value.vt) {
    case VT_BSTR:
        return bstrToUtf8(value.bstrVal);
    case VT_BOOL:
        return value.boolVal != VARIANT_FALSE ? "True" : "False";
    case VT_I1:
        return std::to_string(value.cVal);
    case VT_UI1:
        return std::to_string(value.bVal);
    case VT_I2:
        return std::to_string(value.iVal);
    case VT_UI2:
        return std::to_string(value.uiVal);
    case VT_I4:
    case VT_INT:
        return std::to_string(value.lVal);
    case VT_UI4:
    case VT_UINT:
        return std::to_string(value.ulVal);
    case VT_I8:
        return std::to_string(value.llVal);
    case VT_UI8:
        return std::to_string(value.ullVal);
    case VT_R4:
        return std::format("{}", value.fltVal);
    case VT_R8:
        return std::format("{}", value.dblVal);
    default:
        break;
    }

    // Anything else: let OLE coerce it to a string
    Variant converted;
    if (FAILED(VariantChangeType(converted.put(), &value, 0, VT_BSTR))) {
        return std::nullopt;
    }
    return bstrToUtf8(converted.get().bstrVal);
}

std::expected<WmiSession, WmiError> WmiSession::connect(std::wstring_view wmi_namespace) {
    WmiSession session;

    session.com_ = std::make_unique<ComInitializer>(COINIT_MULTITHREADED);
    if (!*session.com_) {
        return std::unexpected(WmiError{WmiStage::ComInitialization, session.com_->result()});
    }

    // Process-wide security; RPC_E_TOO_LATE means the host already chose it
    HRESULT hr = CoInitializeSecurity(nullptr, -1, nullptr, nullptr, RPC_C_AUTHN_LEVEL_DEFAULT,
                                      RPC_C_IMP_LEVEL_IMPERSONATE, nullptr, EOAC_NONE, nullptr);
    if (FAILED(hr) && hr != RPC_E_TOO_LATE) {
        return std::unexpected(WmiError{WmiStage::ComInitialization, hr});
    }

    hr = CoCreateInstance(CLSID_WbemLocator, nullptr, CLSCTX_INPROC_SERVER,
                          IID_PPV_ARGS(&session.locator_));
    if (FAILED(hr)) {
        return std::unexpected(WmiError{WmiStage::CreateLocator, hr});
    }

    _bstr_t resource(std::wstring(wmi_namespace).c_str());
    hr = session.locator_->ConnectServer(resource, nullptr, nullptr, nullptr, 0, nullptr,
                                         nullptr, &session.services_);
    if (FAILED(hr)) {
        return std::unexpected(WmiError{WmiStage::ConnectServer, hr});
    }

    hr = CoSetProxyBlanket(session.services_.Get(), RPC_C_AUTHN_WINNT, RPC_C_AUTHZ_NONE, nullptr,
                           RPC_C_AUTHN_LEVEL_CALL, RPC_C_IMP_LEVEL_IMPERSONATE, nullptr,
                           EOAC_NONE);
    if (FAILED(hr)) {
        return std::unexpected(WmiError{WmiStage::ProxyBlanket, hr});
    }

    return session;
}

std::expected<std::optional<std::string>, WmiError> WmiSession::queryFirst(
    std::string_view wql, std::string_view property) const {
    auto wide_query = utf8ToWide(wql);
    auto wide_property = utf8ToWide(property);
    if (!wide_query || !wide_property) {
        return std::unexpected(WmiError{WmiStage::InvalidProperty, E_INVALIDARG});
    }

    ComPtr<IEnumWbemClassObject> enumerator;
    HRESULT hr = services_->ExecQuery(_bstr_t(L"WQL"), _bstr_t(wide_query->c_str()),
                                      WBEM_FLAG_FORWARD_ONLY | WBEM_FLAG_RETURN_IMMEDIATELY,
                                      nullptr, &enumerator);
    if (FAILED(hr)) {
        return std::unexpected(WmiError{WmiStage::ExecQuery, hr});
    }

    ComPtr<IWbemClassObject> instance;
    ULONG returned = 0;
    hr = enumerator->Next(WBEM_INFINITE, 1, &instance, &returned);
    if (FAILED(hr)) {
        return std::unexpected(WmiError{WmiStage::NextInstance, hr});
    }
    if (returned == 0 || !instance) {
        return std::nullopt;
    }

    Variant value;
    hr = instance->Get(wide_property->c_str(), 0, value.put(), nullptr, nullptr);
    if (FAILED(hr)) {
        return std::unexpected(WmiError{WmiStage::GetProperty, hr});
    }

    return variantToString(value.get());
}

}  // namespace verinfo::sysinfo
