#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <ostream>

// Known information about an unopened device, as produced by enumeration.
struct UsbDeviceInformation {
    uint16_t vendorId = 0;
    uint16_t productId = 0;

    std::optional<std::string> serial;
    std::optional<std::string> vendor;
    std::optional<std::string> product;

    // Backend private locators used to find the physical device again at
    // open time. Leave them alone unless you are writing a backend.
    std::optional<uint64_t> backendNumericLocation;
    std::optional<std::string> backendStringLocation;
};

std::ostream &operator<<(std::ostream &os, const UsbDeviceInformation &information);

// Filter over UsbDeviceInformation; unset fields match anything.
struct UsbDeviceSelector {
    std::optional<uint16_t> vendorId;
    std::optional<uint16_t> productId;
    std::optional<std::string> serial;

    bool Matches(const UsbDeviceInformation &device) const;
};
