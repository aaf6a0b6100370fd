#include <catch2/catch_all.hpp>

#include "usb_request.hpp"
#include "usb_endpoint.hpp"

TEST_CASE("Request type bytes follow the USB bit layout", "[request]")
{
    REQUIRE(UsbRequestTypeByte(USB_STANDARD_IN_FROM_DEVICE) == 0x80);
    REQUIRE(UsbRequestTypeByte(USB_STANDARD_OUT_TO_DEVICE) == 0x00);
    REQUIRE(UsbRequestTypeByte(USB_VENDOR_IN_FROM_DEVICE) == 0xC0);
    REQUIRE(UsbRequestTypeByte(USB_VENDOR_OUT_TO_DEVICE) == 0x40);
    REQUIRE(UsbRequestTypeByte(USB_CLASS_OUT_TO_INTERFACE) == 0x21);
    REQUIRE(UsbRequestTypeByte(USB_CLASS_IN_FROM_INTERFACE) == 0xA1);

    UsbRequestType toEndpoint{USB_REQUEST_DIRECTION_OUT, USB_REQUEST_KIND_STANDARD, USB_REQUEST_RECIPIENT_ENDPOINT};
    REQUIRE(UsbRequestTypeByte(toEndpoint) == 0x02);
}

TEST_CASE("Endpoint addresses carry the direction in bit 7", "[request]")
{
    REQUIRE(UsbAddressForInEndpoint(1) == 0x81);
    REQUIRE(UsbAddressForOutEndpoint(2) == 0x02);
    REQUIRE(UsbAddressForOutEndpoint(0x82) == 0x02);
    REQUIRE(UsbNumberForEndpointAddress(0x83) == 3);
    REQUIRE(UsbEndpointAddressIsIn(0x81));
    REQUIRE_FALSE(UsbEndpointAddressIsIn(0x01));
}
