#pragma once

#include <memory>
#include <vector>

#include "usb_backend.hpp"
#include "usb_device.hpp"
#include "usb_device_information.hpp"
#include "usb_error.hpp"
#include "usb_host_config.hpp"

// Entry point of the library: enumerates devices through a backend and
// opens them.
class UsbHost {
public:
    // Uses a backend that was created elsewhere, for example a test fixture.
    explicit UsbHost(std::shared_ptr<UsbBackend> backend);
    ~UsbHost();

    // Creates the backend named in the configuration.
    static UsbResult<std::unique_ptr<UsbHost>> Create(const UsbHostConfig &config = UsbHostConfig());

    const char *GetBackendName() const;

    // First device matching the selector, or USB_ERROR_DEVICE_NOT_FOUND.
    UsbResult<UsbDeviceInformation> Device(const UsbDeviceSelector &selector);
    UsbResult<std::vector<UsbDeviceInformation>> Devices(const UsbDeviceSelector &selector);
    UsbResult<std::vector<UsbDeviceInformation>> AllDevices();

    UsbResult<std::unique_ptr<UsbDevice>> Open(const UsbDeviceInformation &information);

private:
    class UsbHostImpl;
    std::unique_ptr<UsbHostImpl> pImpl;
};

// Each of these creates a host with the default configuration for the
// duration of the call.
UsbResult<UsbDeviceInformation> UsbFindDevice(const UsbDeviceSelector &selector);
UsbResult<std::vector<UsbDeviceInformation>> UsbFindDevices(const UsbDeviceSelector &selector);
UsbResult<std::vector<UsbDeviceInformation>> UsbAllDevices();
UsbResult<std::unique_ptr<UsbDevice>> UsbOpen(const UsbDeviceInformation &information);
