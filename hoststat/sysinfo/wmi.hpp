/*
 * wmi.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-3

Description: Scoped WMI sessions and the WMI process query (Windows only)

**************************************************/

#ifndef HOSTSTAT_SYSINFO_WMI_HPP
#define HOSTSTAT_SYSINFO_WMI_HPP

#ifdef _WIN32

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// clang-format off
#include <windows.h>
#include <comdef.h>
#include <wbemidl.h>
// clang-format on

#include "hoststat/system/process_query.hpp"

namespace hoststat::sysinfo {

/**
 * @brief RAII COM initializer
 */
class ComInitializer {
public:
    explicit ComInitializer(COINIT coinit = COINIT_MULTITHREADED);
    ~ComInitializer();

    ComInitializer(const ComInitializer&) = delete;
    ComInitializer& operator=(const ComInitializer&) = delete;

private:
    bool initialized_;
};

/**
 * @brief Smart pointer for COM interfaces
 */
template <typename T>
class ComPtr {
public:
    ComPtr() : ptr_(nullptr) {}
    explicit ComPtr(T* ptr) : ptr_(ptr) {}

    ~ComPtr() {
        if (ptr_) {
            ptr_->Release();
        }
    }

    ComPtr(ComPtr&& other) noexcept : ptr_(other.ptr_) { other.ptr_ = nullptr; }

    ComPtr& operator=(ComPtr&& other) noexcept {
        if (this != &other) {
            if (ptr_) {
                ptr_->Release();
            }
            ptr_ = other.ptr_;
            other.ptr_ = nullptr;
        }
        return *this;
    }

    ComPtr(const ComPtr&) = delete;
    ComPtr& operator=(const ComPtr&) = delete;

    T* get() const { return ptr_; }
    T** getAddressOf() { return &ptr_; }
    T* operator->() const { return ptr_; }
    explicit operator bool() const { return ptr_ != nullptr; }

private:
    T* ptr_;
};

/**
 * @class WmiSession
 * @brief Connection to a WMI namespace. COM is initialised for the lifetime
 * of the session and released when it is destroyed.
 */
class WmiSession {
public:
    explicit WmiSession(const wchar_t* wmiNamespace = L"ROOT\\CIMV2");

    WmiSession(const WmiSession&) = delete;
    WmiSession& operator=(const WmiSession&) = delete;

    /**
     * @brief Runs a WQL query and collects every returned object.
     * @throws error::SystemQueryError when the query is rejected.
     */
    auto query(const std::wstring& wql)
        -> std::vector<ComPtr<IWbemClassObject>>;

    [[nodiscard]] auto services() const -> IWbemServices* {
        return services_.get();
    }

private:
    // Declared first so COM is torn down after the interfaces are released.
    ComInitializer com_;
    ComPtr<IWbemServices> services_;
};

/**
 * @brief Reads a string property as UTF-8; std::nullopt when it is NULL.
 */
auto getStringProperty(IWbemClassObject* object, const wchar_t* name)
    -> std::optional<std::string>;

/**
 * @brief Reads an integer property, including 64-bit values that WMI
 * delivers as decimal strings.
 */
auto getIntegerProperty(IWbemClassObject* object, const wchar_t* name)
    -> std::uint64_t;

/**
 * @brief ProcessQuery backed by Win32_Process and
 * Win32_PerfRawData_PerfProc_Process.
 */
class WmiProcessQuery : public system::ProcessQuery {
public:
    auto processes()
        -> std::vector<std::unique_ptr<system::ProcessHandle>> override;
    auto workingSet(std::uint32_t pid) -> std::uint64_t override;
};

}  // namespace hoststat::sysinfo

#endif  // _WIN32

#endif  // HOSTSTAT_SYSINFO_WMI_HPP
