#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <utility>

enum UsbErrorKind {
    USB_ERROR_UNSUPPORTED,
    USB_ERROR_DEVICE_NOT_FOUND,
    USB_ERROR_DEVICE_NOT_OPEN,
    USB_ERROR_DEVICE_NOT_REAL,
    USB_ERROR_DEVICE_RESERVED,
    USB_ERROR_STALLED,
    USB_ERROR_INVALID_ENDPOINT,
    USB_ERROR_INVALID_INTERFACE,
    USB_ERROR_TIMED_OUT,
    USB_ERROR_INVALID_ARGUMENT,
    USB_ERROR_ABORTED,
    USB_ERROR_OVERRUN,
    USB_ERROR_PERMISSION_DENIED,
    USB_ERROR_OS_ERROR,
    USB_ERROR_UNSPECIFIED_OS_ERROR,
};

const char *UsbErrorKindToString(UsbErrorKind kind);

// Terminates the process after logging the message. Reserved for broken
// internal invariants; never used for conditions a caller could handle.
[[noreturn]] void UsbHostFatal(const std::string &message);

class UsbError {
public:
    UsbError(UsbErrorKind kind) : m_kind{kind}, m_osCode{0}
    {}

    static UsbError FromOsCode(int64_t osCode)
    {
        return UsbError(USB_ERROR_OS_ERROR, osCode);
    }

    UsbErrorKind GetKind() const { return m_kind; }

    // Only meaningful for USB_ERROR_OS_ERROR.
    int64_t GetOsCode() const { return m_osCode; }

    std::string GetMessage() const;

    bool operator==(const UsbError &other) const
    {
        return m_kind == other.m_kind && m_osCode == other.m_osCode;
    }

    bool operator!=(const UsbError &other) const
    {
        return !(*this == other);
    }

private:
    UsbError(UsbErrorKind kind, int64_t osCode) : m_kind{kind}, m_osCode{osCode}
    {}

    UsbErrorKind m_kind;
    int64_t m_osCode;
};

template <typename T>
class UsbResult {
public:
    using ResultVariant = std::variant<T, UsbError>;

    UsbResult(T value) : m_result(std::in_place_index<0>, std::move(value))
    {}

    UsbResult(UsbError error) : m_result(std::in_place_index<1>, error)
    {}

    UsbResult(UsbErrorKind kind) : m_result(std::in_place_index<1>, UsbError(kind))
    {}

    bool IsOk() const
    {
        return m_result.index() == 0;
    }

    explicit operator bool() const
    {
        return IsOk();
    }

    const T &GetValue() const
    {
        if (!IsOk()) {
            UsbHostFatal("UsbResult::GetValue called on a failed result: " + GetError().GetMessage());
        }
        return std::get<0>(m_result);
    }

    T &GetValue()
    {
        if (!IsOk()) {
            UsbHostFatal("UsbResult::GetValue called on a failed result: " + GetError().GetMessage());
        }
        return std::get<0>(m_result);
    }

    T TakeValue()
    {
        return std::move(GetValue());
    }

    const UsbError &GetError() const
    {
        if (IsOk()) {
            UsbHostFatal("UsbResult::GetError called on a successful result");
        }
        return std::get<1>(m_result);
    }

private:
    ResultVariant m_result;
};

template <>
class UsbResult<void> {
public:
    UsbResult() : m_result(std::in_place_index<0>)
    {}

    UsbResult(UsbError error) : m_result(std::in_place_index<1>, error)
    {}

    UsbResult(UsbErrorKind kind) : m_result(std::in_place_index<1>, UsbError(kind))
    {}

    bool IsOk() const
    {
        return m_result.index() == 0;
    }

    explicit operator bool() const
    {
        return IsOk();
    }

    const UsbError &GetError() const
    {
        if (IsOk()) {
            UsbHostFatal("UsbResult::GetError called on a successful result");
        }
        return std::get<1>(m_result);
    }

private:
    std::variant<std::monostate, UsbError> m_result;
};

using UsbStatus = UsbResult<void>;
