/*
 * wmi.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-3

Description: Scoped WMI sessions and the WMI process query (Windows only)

**************************************************/

#include "wmi.hpp"

#include <spdlog/spdlog.h>

#include "hoststat/error/exception.hpp"
#include "hoststat/utils/string.hpp"

#if defined(_MSC_VER)
#pragma comment(lib, "wbemuuid.lib")
#endif

namespace hoststat::sysinfo {

namespace {
auto toUtf8(const wchar_t* wide, int length) -> std::string {
    if (wide == nullptr || length == 0) {
        return {};
    }
    int size = WideCharToMultiByte(CP_UTF8, 0, wide, length, nullptr, 0,
                                   nullptr, nullptr);
    std::string result(static_cast<std::size_t>(size), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide, length, result.data(), size, nullptr,
                        nullptr);
    return result;
}

/**
 * @brief VARIANT that is always cleared.
 */
class ScopedVariant {
public:
    ScopedVariant() { VariantInit(&value_); }
    ~ScopedVariant() { VariantClear(&value_); }

    ScopedVariant(const ScopedVariant&) = delete;
    ScopedVariant& operator=(const ScopedVariant&) = delete;

    VARIANT* get() { return &value_; }
    const VARIANT& operator*() const { return value_; }

private:
    VARIANT value_;
};

/**
 * @brief One Win32_Process row. Holds the session that produced it so the
 * GetOwner method can be executed later in the same call.
 */
class WmiProcessHandle : public system::ProcessHandle {
public:
    WmiProcessHandle(std::shared_ptr<WmiSession> session,
                     ComPtr<IWbemClassObject> object)
        : session_(std::move(session)), object_(std::move(object)) {
        pid_ = static_cast<std::uint32_t>(
            getIntegerProperty(object_.get(), L"ProcessId"));
        name_ = getStringProperty(object_.get(), L"Name").value_or("");
        commandLine_ = getStringProperty(object_.get(), L"CommandLine");
    }

    [[nodiscard]] auto pid() const -> std::uint32_t override { return pid_; }
    [[nodiscard]] auto name() const -> std::string override { return name_; }
    [[nodiscard]] auto commandLine() const
        -> std::optional<std::string> override {
        return commandLine_;
    }

    auto getOwner() -> system::OwnerLookup override {
        ScopedVariant path;
        HRESULT hr = object_->Get(L"__PATH", 0, path.get(), nullptr, nullptr);
        if (FAILED(hr) || (*path).vt != VT_BSTR) {
            THROW_SYSTEM_QUERY_ERROR(hr, "No object path for process ", pid_);
        }

        ComPtr<IWbemClassObject> outParams;
        hr = session_->services()->ExecMethod(
            (*path).bstrVal, _bstr_t(L"GetOwner"), 0, nullptr, nullptr,
            outParams.getAddressOf(), nullptr);
        if (FAILED(hr) || !outParams) {
            THROW_SYSTEM_QUERY_ERROR(hr, "GetOwner failed for process ", pid_);
        }

        system::OwnerLookup owner;
        owner.errorCode = static_cast<int>(
            getIntegerProperty(outParams.get(), L"ReturnValue"));
        owner.user = getStringProperty(outParams.get(), L"User").value_or("");
        owner.domain =
            getStringProperty(outParams.get(), L"Domain").value_or("");
        return owner;
    }

private:
    std::shared_ptr<WmiSession> session_;
    ComPtr<IWbemClassObject> object_;
    std::uint32_t pid_ = 0;
    std::string name_;
    std::optional<std::string> commandLine_;
};
}  // namespace

ComInitializer::ComInitializer(COINIT coinit) : initialized_(false) {
    HRESULT hr = CoInitializeEx(nullptr, coinit);
    if (SUCCEEDED(hr)) {
        initialized_ = true;
    } else if (hr != RPC_E_CHANGED_MODE) {
        THROW_RUNTIME_ERROR("Failed to initialize COM library, HRESULT ",
                            static_cast<long>(hr));
    }
}

ComInitializer::~ComInitializer() {
    if (initialized_) {
        CoUninitialize();
    }
}

WmiSession::WmiSession(const wchar_t* wmiNamespace) {
    HRESULT hres = CoInitializeSecurity(
        nullptr, -1, nullptr, nullptr, RPC_C_AUTHN_LEVEL_DEFAULT,
        RPC_C_IMP_LEVEL_IMPERSONATE, nullptr, EOAC_NONE, nullptr);
    // RPC_E_TOO_LATE: security was already set up for this process.
    if (FAILED(hres) && hres != RPC_E_TOO_LATE) {
        THROW_RUNTIME_ERROR("Failed to initialize COM security, HRESULT ",
                            static_cast<long>(hres));
    }

    ComPtr<IWbemLocator> locator;
    hres = CoCreateInstance(CLSID_WbemLocator, nullptr, CLSCTX_INPROC_SERVER,
                            IID_IWbemLocator,
                            reinterpret_cast<LPVOID*>(locator.getAddressOf()));
    if (FAILED(hres)) {
        THROW_RUNTIME_ERROR("Failed to create IWbemLocator object");
    }

    hres = locator->ConnectServer(_bstr_t(wmiNamespace), nullptr, nullptr,
                                  nullptr, 0, nullptr, nullptr,
                                  services_.getAddressOf());
    if (FAILED(hres)) {
        THROW_RUNTIME_ERROR("Could not connect to WMI namespace");
    }

    hres = CoSetProxyBlanket(services_.get(), RPC_C_AUTHN_WINNT,
                             RPC_C_AUTHZ_NONE, nullptr, RPC_C_AUTHN_LEVEL_CALL,
                             RPC_C_IMP_LEVEL_IMPERSONATE, nullptr, EOAC_NONE);
    if (FAILED(hres)) {
        THROW_RUNTIME_ERROR("Could not set proxy blanket");
    }
}

auto WmiSession::query(const std::wstring& wql)
    -> std::vector<ComPtr<IWbemClassObject>> {
    ComPtr<IEnumWbemClassObject> enumerator;
    HRESULT hres = services_->ExecQuery(
        _bstr_t(L"WQL"), _bstr_t(wql.c_str()),
        WBEM_FLAG_FORWARD_ONLY | WBEM_FLAG_RETURN_IMMEDIATELY, nullptr,
        enumerator.getAddressOf());
    if (FAILED(hres)) {
        THROW_SYSTEM_QUERY_ERROR(hres, "WMI query failed: ",
                                 toUtf8(wql.c_str(),
                                        static_cast<int>(wql.size())));
    }

    std::vector<ComPtr<IWbemClassObject>> rows;
    while (true) {
        ComPtr<IWbemClassObject> object;
        ULONG returned = 0;
        hres = enumerator->Next(WBEM_INFINITE, 1, object.getAddressOf(),
                                &returned);
        if (FAILED(hres)) {
            THROW_SYSTEM_QUERY_ERROR(hres, "WMI enumeration failed");
        }
        if (returned == 0) {
            break;
        }
        rows.push_back(std::move(object));
    }
    return rows;
}

auto getStringProperty(IWbemClassObject* object, const wchar_t* name)
    -> std::optional<std::string> {
    ScopedVariant value;
    if (FAILED(object->Get(name, 0, value.get(), nullptr, nullptr))) {
        return std::nullopt;
    }
    if ((*value).vt != VT_BSTR || (*value).bstrVal == nullptr) {
        return std::nullopt;
    }
    return toUtf8((*value).bstrVal,
                  static_cast<int>(SysStringLen((*value).bstrVal)));
}

auto getIntegerProperty(IWbemClassObject* object, const wchar_t* name)
    -> std::uint64_t {
    ScopedVariant value;
    HRESULT hr = object->Get(name, 0, value.get(), nullptr, nullptr);
    if (FAILED(hr)) {
        THROW_SYSTEM_QUERY_ERROR(hr, "Missing WMI property");
    }

    switch ((*value).vt) {
        case VT_I4:
            return static_cast<std::uint32_t>((*value).lVal);
        case VT_UI4:
            return (*value).ulVal;
        case VT_I8:
            return static_cast<std::uint64_t>((*value).llVal);
        case VT_UI8:
            return (*value).ullVal;
        case VT_BSTR: {
            const auto text = toUtf8(
                (*value).bstrVal,
                static_cast<int>(SysStringLen((*value).bstrVal)));
            if (auto parsed = utils::parseInteger(text); parsed && *parsed >= 0) {
                return static_cast<std::uint64_t>(*parsed);
            }
            THROW_SYSTEM_QUERY_ERROR(0, "Non-numeric WMI property: ", text);
        }
        default:
            THROW_SYSTEM_QUERY_ERROR(0, "Unexpected WMI property type ",
                                     (*value).vt);
    }
}

auto WmiProcessQuery::processes()
    -> std::vector<std::unique_ptr<system::ProcessHandle>> {
    auto session = std::make_shared<WmiSession>();
    auto rows = session->query(
        L"SELECT Handle, ProcessId, Name, CommandLine FROM Win32_Process");

    std::vector<std::unique_ptr<system::ProcessHandle>> handles;
    handles.reserve(rows.size());
    for (auto& row : rows) {
        handles.push_back(
            std::make_unique<WmiProcessHandle>(session, std::move(row)));
    }
    spdlog::debug("Enumerated {} processes", handles.size());
    return handles;
}

auto WmiProcessQuery::workingSet(std::uint32_t pid) -> std::uint64_t {
    WmiSession session;
    auto rows = session.query(
        L"SELECT WorkingSet FROM Win32_PerfRawData_PerfProc_Process "
        L"WHERE IDProcess=" +
        std::to_wstring(pid));
    if (rows.empty()) {
        THROW_SYSTEM_QUERY_ERROR(0, "No performance data for process ", pid);
    }
    return getIntegerProperty(rows.front().get(), L"WorkingSet");
}

}  // namespace hoststat::sysinfo
