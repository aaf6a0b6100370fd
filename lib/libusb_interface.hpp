#pragma once

#include <cstdint>
#include <map>
#include <libusb-1.0/libusb.h>

#include "usb_error.hpp"
#include "usb_endpoint.hpp"

// One interface of an opened device and whether we currently hold its claim.
//
// An interface the OS refused to give us is kept as a placeholder: it stays
// visible, but every operation on it fails with USB_ERROR_PERMISSION_DENIED.
class LibusbInterface {
public:
    LibusbInterface(libusb_device_handle *handle, uint8_t number);
    ~LibusbInterface();

    LibusbInterface(LibusbInterface &&other);
    LibusbInterface &operator=(LibusbInterface &&other) = delete;
    LibusbInterface(const LibusbInterface &) = delete;
    LibusbInterface &operator=(const LibusbInterface &) = delete;

    static LibusbInterface DenyingPlaceholder(uint8_t number);

    uint8_t GetNumber() const { return m_number; }
    bool IsClaimed() const { return m_claimed; }
    bool IsPlaceholder() const { return m_handle == nullptr; }

    // Claiming an interface we already hold succeeds without touching the OS.
    UsbStatus Claim();
    UsbStatus Unclaim();

    UsbStatus SetAlternateSetting(uint8_t setting);
    UsbStatus ReleaseKernelDriver();

private:
    // Non-owning; null for placeholders.
    libusb_device_handle *m_handle;
    uint8_t m_number;
    bool m_claimed;
};

// Looks up the endpoint a bulk or interrupt transfer is aimed at and checks
// that the interface it belongs to is ours to use.
UsbResult<UsbEndpointInformation> LibusbResolveEndpoint(uint8_t endpointAddress,
    const std::map<uint8_t, UsbEndpointInformation> &endpoints,
    const std::map<uint8_t, LibusbInterface> &interfaces);
