#pragma once

#include <cstdint>

enum UsbTransferType : uint8_t {
    USB_TRANSFER_TYPE_CONTROL = 0,
    USB_TRANSFER_TYPE_ISOCHRONOUS = 1,
    USB_TRANSFER_TYPE_BULK = 2,
    USB_TRANSFER_TYPE_INTERRUPT = 3,
};

// What a backend needs to address one endpoint of an opened device.
struct UsbEndpointInformation {
    uint8_t interfaceNumber;

    // One based index of the endpoint within its interface.
    uint8_t pipeRef;

    UsbTransferType transferType;
    uint16_t maxPacketSize;
};

constexpr uint8_t USB_ENDPOINT_DIRECTION_IN = 0x80;

constexpr uint8_t UsbAddressForOutEndpoint(uint8_t number)
{
    return number & 0x7F;
}

constexpr uint8_t UsbAddressForInEndpoint(uint8_t number)
{
    return (number & 0x7F) | USB_ENDPOINT_DIRECTION_IN;
}

constexpr uint8_t UsbNumberForEndpointAddress(uint8_t address)
{
    return address & 0x7F;
}

constexpr bool UsbEndpointAddressIsIn(uint8_t address)
{
    return (address & USB_ENDPOINT_DIRECTION_IN) != 0;
}
