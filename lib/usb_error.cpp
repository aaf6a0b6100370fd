#include <iostream>
#include <cstdlib>
#include <sstream>

#include "usb_error.hpp"
#include "usbhost_log.hpp"

const char *UsbErrorKindToString(UsbErrorKind kind)
{
    switch (kind) {
        case USB_ERROR_UNSUPPORTED:
            return "operation not supported";
        case USB_ERROR_DEVICE_NOT_FOUND:
            return "device not found";
        case USB_ERROR_DEVICE_NOT_OPEN:
            return "device not open";
        case USB_ERROR_DEVICE_NOT_REAL:
            return "device has no addressable USB interface";
        case USB_ERROR_DEVICE_RESERVED:
            return "device reserved by another driver";
        case USB_ERROR_STALLED:
            return "endpoint stalled";
        case USB_ERROR_INVALID_ENDPOINT:
            return "invalid endpoint";
        case USB_ERROR_INVALID_INTERFACE:
            return "invalid interface";
        case USB_ERROR_TIMED_OUT:
            return "timed out";
        case USB_ERROR_INVALID_ARGUMENT:
            return "invalid argument";
        case USB_ERROR_ABORTED:
            return "aborted";
        case USB_ERROR_OVERRUN:
            return "length exceeds the USB length field";
        case USB_ERROR_PERMISSION_DENIED:
            return "permission denied";
        case USB_ERROR_OS_ERROR:
            return "OS error";
        case USB_ERROR_UNSPECIFIED_OS_ERROR:
            return "unspecified OS error";
    }
    return "unknown error";
}

std::string UsbError::GetMessage() const
{
    if (m_kind == USB_ERROR_OS_ERROR) {
        std::ostringstream os;
        os << UsbErrorKindToString(m_kind) << " (" << m_osCode << ")";
        return os.str();
    }

    return UsbErrorKindToString(m_kind);
}

void UsbHostFatal(const std::string &message)
{
    USBHOST_LOG;

    log(USBHOST_LOG_LEVEL_ERROR) << "internal inconsistency: " << message << endLog;
    UsbHostLogStore::getInstance().Close();

    std::cerr << "usbhost: internal inconsistency: " << message << std::endl;
    std::abort();
}
