#pragma once

#include <cstdint>
#include <cstddef>

// Request type byte layout (USB 2.0, 9.3): direction in bit 7, type in
// bits 6..5, recipient in bits 4..0.

enum UsbRequestDirection : uint8_t {
    USB_REQUEST_DIRECTION_OUT = 0,
    USB_REQUEST_DIRECTION_IN = 1,
};

enum UsbRequestKind : uint8_t {
    USB_REQUEST_KIND_STANDARD = 0,
    USB_REQUEST_KIND_CLASS = 1,
    USB_REQUEST_KIND_VENDOR = 2,
};

enum UsbRequestRecipient : uint8_t {
    USB_REQUEST_RECIPIENT_DEVICE = 0,
    USB_REQUEST_RECIPIENT_INTERFACE = 1,
    USB_REQUEST_RECIPIENT_ENDPOINT = 2,
    USB_REQUEST_RECIPIENT_OTHER = 3,
};

struct UsbRequestType {
    UsbRequestDirection direction;
    UsbRequestKind kind;
    UsbRequestRecipient recipient;
};

constexpr uint8_t UsbRequestTypeByte(UsbRequestType requestType)
{
    return static_cast<uint8_t>((requestType.direction << 7) | (requestType.kind << 5) | requestType.recipient);
}

constexpr UsbRequestType USB_STANDARD_IN_FROM_DEVICE{USB_REQUEST_DIRECTION_IN, USB_REQUEST_KIND_STANDARD, USB_REQUEST_RECIPIENT_DEVICE};
constexpr UsbRequestType USB_STANDARD_OUT_TO_DEVICE{USB_REQUEST_DIRECTION_OUT, USB_REQUEST_KIND_STANDARD, USB_REQUEST_RECIPIENT_DEVICE};
constexpr UsbRequestType USB_VENDOR_IN_FROM_DEVICE{USB_REQUEST_DIRECTION_IN, USB_REQUEST_KIND_VENDOR, USB_REQUEST_RECIPIENT_DEVICE};
constexpr UsbRequestType USB_VENDOR_OUT_TO_DEVICE{USB_REQUEST_DIRECTION_OUT, USB_REQUEST_KIND_VENDOR, USB_REQUEST_RECIPIENT_DEVICE};
// The interface number goes in wIndex for the two interface recipients.
constexpr UsbRequestType USB_CLASS_OUT_TO_INTERFACE{USB_REQUEST_DIRECTION_OUT, USB_REQUEST_KIND_CLASS, USB_REQUEST_RECIPIENT_INTERFACE};
constexpr UsbRequestType USB_CLASS_IN_FROM_INTERFACE{USB_REQUEST_DIRECTION_IN, USB_REQUEST_KIND_CLASS, USB_REQUEST_RECIPIENT_INTERFACE};

enum UsbStandardDeviceRequest : uint8_t {
    USB_REQUEST_GET_STATUS = 0,
    USB_REQUEST_CLEAR_FEATURE = 1,
    USB_REQUEST_SET_FEATURE = 3,
    USB_REQUEST_SET_ADDRESS = 5,
    USB_REQUEST_GET_DESCRIPTOR = 6,
    USB_REQUEST_SET_DESCRIPTOR = 7,
    USB_REQUEST_GET_CONFIGURATION = 8,
    USB_REQUEST_SET_CONFIGURATION = 9,
};

enum UsbDescriptorType : uint8_t {
    USB_DESCRIPTOR_TYPE_DEVICE = 1,
    USB_DESCRIPTOR_TYPE_CONFIGURATION = 2,
    USB_DESCRIPTOR_TYPE_STRING = 3,
    USB_DESCRIPTOR_TYPE_INTERFACE = 4,
    USB_DESCRIPTOR_TYPE_ENDPOINT = 5,
};

// wLength is a 16 bit field.
constexpr size_t USB_MAX_CONTROL_LENGTH = 0xFFFF;
