#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>

#include "usb_backend.hpp"
#include "usb_device_information.hpp"
#include "usb_error.hpp"
#include "usb_future.hpp"
#include "usb_request.hpp"

// An opened USB device.
//
// Created by UsbHost::Open(). Destroying it aborts the transfers still in
// flight, waits for their callbacks, and releases the device and its
// interfaces. It must not be destroyed from one of its own callbacks.
//
// Callbacks of the non-blocking operations run on the device's event loop
// thread, never on the thread that submitted the transfer.
class UsbDevice {
public:
    UsbDevice(std::unique_ptr<UsbBackendDevice> backendDevice, std::shared_ptr<UsbBackend> backend,
        const UsbDeviceInformation &information);
    ~UsbDevice();

    UsbDevice(const UsbDevice &) = delete;
    UsbDevice &operator=(const UsbDevice &) = delete;

    const UsbDeviceInformation &GetInformation() const { return m_information; }
    const char *GetBackendName() const;

    UsbStatus ReleaseKernelDriver(uint8_t interfaceNumber);

    UsbStatus ClaimInterface(uint8_t interfaceNumber);
    UsbStatus UnclaimInterface(uint8_t interfaceNumber);
    bool IsInterfaceClaimed(uint8_t interfaceNumber) const;

    UsbResult<uint8_t> ActiveConfiguration();
    UsbStatus SetActiveConfiguration(uint8_t configuration);
    UsbStatus ResetDevice();
    UsbStatus ClearStall(uint8_t endpointAddress);
    UsbStatus SetAlternateSetting(uint8_t interfaceNumber, uint8_t setting);
    UsbResult<uint64_t> CurrentBusFrame();

    // Control transfers. Data stages longer than 65535 bytes fail with
    // USB_ERROR_OVERRUN before anything is sent to the device.
    UsbResult<size_t> ControlRead(UsbRequestType requestType, uint8_t request, uint16_t value, uint16_t index,
        uint8_t *data, size_t length, UsbTimeout timeout = std::nullopt);
    UsbResult<size_t> ControlWrite(UsbRequestType requestType, uint8_t request, uint16_t value, uint16_t index,
        const uint8_t *data, size_t length, UsbTimeout timeout = std::nullopt);

    UsbStatus ControlReadAsync(UsbRequestType requestType, uint8_t request, uint16_t value, uint16_t index,
        UsbReadBuffer buffer, UsbTransferCallback callback, UsbTimeout timeout = std::nullopt);
    UsbResult<UsbTransferFuture> ControlReadAsync(UsbRequestType requestType, uint8_t request, uint16_t value,
        uint16_t index, UsbReadBuffer buffer, UsbTimeout timeout = std::nullopt);
    UsbStatus ControlWriteAsync(UsbRequestType requestType, uint8_t request, uint16_t value, uint16_t index,
        std::vector<uint8_t> data, UsbTransferCallback callback, UsbTimeout timeout = std::nullopt);
    UsbResult<UsbTransferFuture> ControlWriteAsync(UsbRequestType requestType, uint8_t request, uint16_t value,
        uint16_t index, std::vector<uint8_t> data, UsbTimeout timeout = std::nullopt);

    // Bulk and interrupt transfers, addressed by endpoint number. The
    // endpoint's interface must be claimed.
    UsbResult<size_t> Read(uint8_t endpoint, uint8_t *data, size_t length, UsbTimeout timeout = std::nullopt);
    UsbResult<size_t> Write(uint8_t endpoint, const uint8_t *data, size_t length, UsbTimeout timeout = std::nullopt);

    UsbStatus ReadAsync(uint8_t endpoint, UsbReadBuffer buffer, UsbTransferCallback callback,
        UsbTimeout timeout = std::nullopt);
    UsbResult<UsbTransferFuture> ReadAsync(uint8_t endpoint, UsbReadBuffer buffer, UsbTimeout timeout = std::nullopt);
    UsbStatus WriteAsync(uint8_t endpoint, std::vector<uint8_t> data, UsbTransferCallback callback,
        UsbTimeout timeout = std::nullopt);
    UsbResult<UsbTransferFuture> WriteAsync(uint8_t endpoint, std::vector<uint8_t> data,
        UsbTimeout timeout = std::nullopt);

    // GET_DESCRIPTOR for a standard descriptor. Returns the bytes the device sent.
    UsbResult<std::vector<uint8_t>> ReadStandardDescriptor(UsbDescriptorType type, uint8_t index,
        size_t length, UsbTimeout timeout = std::nullopt);
    UsbResult<UsbTransferFuture> ReadStandardDescriptorAsync(UsbDescriptorType type, uint8_t index,
        UsbReadBuffer buffer, UsbTimeout timeout = std::nullopt);

    // Cancels every in-flight non-blocking transfer. Their callbacks
    // receive USB_ERROR_ABORTED.
    UsbStatus Abort();

private:
    UsbDeviceInformation m_information;
    std::shared_ptr<UsbBackend> m_backend;
    std::unique_ptr<UsbBackendDevice> m_backendDevice;
};
