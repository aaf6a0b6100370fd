#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "usb_error.hpp"
#include "usb_device_information.hpp"

// std::nullopt waits forever.
using UsbTimeout = std::optional<std::chrono::milliseconds>;

// Destination of a non-blocking read. The backend keeps a reference until the
// transfer completes; the bytes read are at the front of the buffer.
using UsbReadBuffer = std::shared_ptr<std::vector<uint8_t>>;

// Invoked exactly once, from the device's event loop thread.
using UsbTransferCallback = std::function<void(UsbResult<size_t>)>;

UsbReadBuffer CreateReadBuffer(size_t size);

// Fails with USB_ERROR_OVERRUN when a control data stage would not fit in wLength.
UsbStatus UsbValidateControlLength(size_t length);

// Per device resources of an opened device. Only the backend that produced an
// instance knows its concrete type, so every operation dispatches to it directly.
class UsbBackendDevice {
public:
    UsbBackendDevice()
    {}
    virtual ~UsbBackendDevice()
    {}

    virtual UsbStatus ReleaseKernelDriver(uint8_t interfaceNumber) = 0;

    virtual UsbStatus ClaimInterface(uint8_t interfaceNumber) = 0;
    virtual UsbStatus UnclaimInterface(uint8_t interfaceNumber) = 0;
    virtual bool IsInterfaceClaimed(uint8_t interfaceNumber) const = 0;

    virtual UsbResult<uint8_t> ActiveConfiguration() = 0;
    virtual UsbStatus SetActiveConfiguration(uint8_t configuration) = 0;
    virtual UsbStatus ResetDevice() = 0;
    virtual UsbStatus ClearStall(uint8_t endpointAddress) = 0;
    virtual UsbStatus SetAlternateSetting(uint8_t interfaceNumber, uint8_t setting) = 0;
    virtual UsbResult<uint64_t> CurrentBusFrame() = 0;

    virtual UsbResult<size_t> ControlRead(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
        uint8_t *data, size_t length, UsbTimeout timeout) = 0;
    virtual UsbResult<size_t> ControlWrite(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
        const uint8_t *data, size_t length, UsbTimeout timeout) = 0;

    // Non-blocking forms return once the request has been submitted. The
    // callback is not invoked when submission fails.
    virtual UsbStatus ControlReadNonblocking(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
        UsbReadBuffer buffer, UsbTransferCallback callback, UsbTimeout timeout) = 0;
    virtual UsbStatus ControlWriteNonblocking(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
        std::vector<uint8_t> data, UsbTransferCallback callback, UsbTimeout timeout) = 0;

    virtual UsbResult<size_t> Read(uint8_t endpointAddress, uint8_t *data, size_t length, UsbTimeout timeout) = 0;
    virtual UsbResult<size_t> Write(uint8_t endpointAddress, const uint8_t *data, size_t length, UsbTimeout timeout) = 0;

    virtual UsbStatus ReadNonblocking(uint8_t endpointAddress, UsbReadBuffer buffer,
        UsbTransferCallback callback, UsbTimeout timeout) = 0;
    virtual UsbStatus WriteNonblocking(uint8_t endpointAddress, std::vector<uint8_t> data,
        UsbTransferCallback callback, UsbTimeout timeout) = 0;

    // Cancels every in-flight non-blocking transfer; their callbacks receive USB_ERROR_ABORTED.
    virtual UsbStatus Abort() = 0;
};

class UsbBackend {
public:
    UsbBackend()
    {}
    virtual ~UsbBackend()
    {}

    virtual const char *GetName() const = 0;

    // Devices without a usable locator are left out rather than reported as errors.
    virtual UsbResult<std::vector<UsbDeviceInformation>> GetDevices() = 0;

    virtual UsbResult<std::unique_ptr<UsbBackendDevice>> Open(const UsbDeviceInformation &information) = 0;
};

struct UsbHostConfig;

UsbResult<std::shared_ptr<UsbBackend>> CreateUsbBackend(const UsbHostConfig &config);
