#include <sstream>
#include <limits>
#include <thread>

#include "libusb_utils.hpp"
#include "usbhost_log.hpp"

UsbError UsbErrorFromLibusb(int rc)
{
    switch (rc) {
        case LIBUSB_ERROR_ACCESS:
            return USB_ERROR_PERMISSION_DENIED;
        case LIBUSB_ERROR_NO_DEVICE:
        case LIBUSB_ERROR_NOT_FOUND:
            return USB_ERROR_DEVICE_NOT_FOUND;
        case LIBUSB_ERROR_BUSY:
            return USB_ERROR_DEVICE_RESERVED;
        case LIBUSB_ERROR_TIMEOUT:
            return USB_ERROR_TIMED_OUT;
        case LIBUSB_ERROR_OVERFLOW:
            return USB_ERROR_OVERRUN;
        case LIBUSB_ERROR_PIPE:
            return USB_ERROR_STALLED;
        case LIBUSB_ERROR_INTERRUPTED:
            return USB_ERROR_ABORTED;
        case LIBUSB_ERROR_INVALID_PARAM:
            return USB_ERROR_INVALID_ARGUMENT;
        case LIBUSB_ERROR_NOT_SUPPORTED:
            return USB_ERROR_UNSUPPORTED;
        case LIBUSB_SUCCESS:
            // A failure path handed us a success code; the OS gave no reason.
            return USB_ERROR_UNSPECIFIED_OS_ERROR;
        default:
            return UsbError::FromOsCode(rc);
    }
}

UsbStatus UsbStatusFromLibusb(int rc)
{
    if (rc >= 0) {
        return {};
    }
    return UsbErrorFromLibusb(rc);
}

int LibusbCancelTransferStatus(int rc)
{
    if (rc == LIBUSB_ERROR_NOT_FOUND || rc == LIBUSB_ERROR_NO_DEVICE) {
        return LIBUSB_SUCCESS;
    }
    return rc;
}

int LibusbRetryNoResources(const std::function<int()> &attempt, int retryCount,
    std::chrono::milliseconds retryDelay)
{
    USBHOST_LOG;

    int ret = LIBUSB_ERROR_NO_MEM;
    for (int i = 0; i <= retryCount; ++i) {
        ret = attempt();
        if (ret != LIBUSB_ERROR_NO_MEM) {
            break;
        }

        log(USBHOST_LOG_LEVEL_DEBUG) << "Device reported no resources on attempt " << (i + 1) << endLog;
        if (i < retryCount) {
            std::this_thread::sleep_for(retryDelay);
        }
    }

    return ret;
}

UsbResult<size_t> UsbResultFromTransferStatus(libusb_transfer_status status, int actualLength)
{
    switch (status) {
        case LIBUSB_TRANSFER_COMPLETED:
            if (actualLength < 0) {
                return USB_ERROR_UNSPECIFIED_OS_ERROR;
            }
            return static_cast<size_t>(actualLength);
        case LIBUSB_TRANSFER_TIMED_OUT:
            return USB_ERROR_TIMED_OUT;
        case LIBUSB_TRANSFER_CANCELLED:
            return USB_ERROR_ABORTED;
        case LIBUSB_TRANSFER_STALL:
            return USB_ERROR_STALLED;
        case LIBUSB_TRANSFER_NO_DEVICE:
            return USB_ERROR_DEVICE_NOT_FOUND;
        case LIBUSB_TRANSFER_OVERFLOW:
            return USB_ERROR_OVERRUN;
        case LIBUSB_TRANSFER_ERROR:
            return UsbError::FromOsCode(LIBUSB_ERROR_IO);
    }
    return USB_ERROR_UNSPECIFIED_OS_ERROR;
}

unsigned int LibusbTimeoutFromUsbTimeout(UsbTimeout timeout)
{
    USBHOST_LOG;

    if (!timeout) {
        return 0;
    }

    auto milliseconds = timeout->count();
    if (milliseconds <= 0) {
        // 0 would mean "forever" to libusb.
        return 1;
    }

    if (static_cast<unsigned long long>(milliseconds) > std::numeric_limits<unsigned int>::max()) {
        log(USBHOST_LOG_LEVEL_WARNING) << "Timeout of " << milliseconds << "ms saturated to "
            << std::numeric_limits<unsigned int>::max() << "ms" << endLog;
        return std::numeric_limits<unsigned int>::max();
    }

    return static_cast<unsigned int>(milliseconds);
}

uint64_t LibusbLocationFor(libusb_device *device)
{
    return (static_cast<uint64_t>(libusb_get_bus_number(device)) << 8) | libusb_get_device_address(device);
}

std::string LibusbPortPathFor(libusb_device *device)
{
    uint8_t portNumbers[8];
    std::stringstream usbPathStream;

    usbPathStream << static_cast<int>(libusb_get_bus_number(device)) << "-";
    int numElementsInPath = libusb_get_port_numbers(device, portNumbers, sizeof(portNumbers));
    if (numElementsInPath > 0) {
        usbPathStream << static_cast<int>(portNumbers[0]);
        for (int i = 1; i < numElementsInPath; ++i) {
            usbPathStream << "." << static_cast<int>(portNumbers[i]);
        }
    }

    return usbPathStream.str();
}
