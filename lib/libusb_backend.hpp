#pragma once

#include <memory>
#include <mutex>
#include <vector>
#include <libusb-1.0/libusb.h>

#include "usb_backend.hpp"
#include "usb_host_config.hpp"
#include "libusb_handles.hpp"

// Backend on top of libusb-1.0.
//
// Enumeration runs on a context owned by the backend. Opened devices get a
// context of their own (see LibusbDevice).
class LibusbBackend : public UsbBackend {
public:
    ~LibusbBackend() override;

    static UsbResult<std::shared_ptr<LibusbBackend>> Create(const UsbHostConfig &config);

    const char *GetName() const override;

    UsbResult<std::vector<UsbDeviceInformation>> GetDevices() override;

    UsbResult<std::unique_ptr<UsbBackendDevice>> Open(const UsbDeviceInformation &information) override;

private:
    LibusbBackend(LibusbContextPtr context, const UsbHostConfig &config);

    std::mutex m_contextMutex;
    LibusbContextPtr m_context;
    UsbHostConfig m_config;

    UsbResult<UsbDeviceInformation> DescribeDevice(libusb_device *device);
    void ReadDeviceStrings(libusb_device *device, const libusb_device_descriptor &desc,
        UsbDeviceInformation &information);
};
