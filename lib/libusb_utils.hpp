#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <libusb-1.0/libusb.h>

#include "usb_error.hpp"
#include "usb_backend.hpp"

// Translation of libusb return codes into the library's error kinds. No
// libusb code is allowed past the backend without going through here.
UsbError UsbErrorFromLibusb(int rc);

UsbStatus UsbStatusFromLibusb(int rc);

// Result of libusb_cancel_transfer with the codes that leave nothing to
// cancel (already completed, device gone) folded into LIBUSB_SUCCESS.
int LibusbCancelTransferStatus(int rc);

// Calls attempt until it returns something other than LIBUSB_ERROR_NO_MEM,
// at most retryCount + 1 times, sleeping retryDelay between calls. Returns
// the last result.
int LibusbRetryNoResources(const std::function<int()> &attempt, int retryCount,
    std::chrono::milliseconds retryDelay);

// Result of a completed asynchronous transfer.
UsbResult<size_t> UsbResultFromTransferStatus(libusb_transfer_status status, int actualLength);

// libusb timeouts are unsigned milliseconds where 0 waits forever. Durations
// that do not fit saturate at the largest representable value.
unsigned int LibusbTimeoutFromUsbTimeout(UsbTimeout timeout);

// Numeric locator for a device: (bus << 8) | address.
uint64_t LibusbLocationFor(libusb_device *device);

// "bus-port.port..." path of a device, as printed by most tooling.
std::string LibusbPortPathFor(libusb_device *device);
