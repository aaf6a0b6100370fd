#include <catch2/catch_all.hpp>

#include <cstddef>
#include <map>

#include "libusb_interface.hpp"

namespace {

constexpr uint8_t BULK_IN = 0x81;
constexpr uint8_t INTERRUPT_IN = 0x83;
constexpr uint8_t ISOCHRONOUS_OUT = 0x04;
constexpr uint8_t DENIED_IN = 0x85;

// Stands in for an open handle. Nothing reads through it while the
// interface stays unclaimed.
alignas(std::max_align_t) unsigned char g_handleStorage[64];

libusb_device_handle *UnusedHandle()
{
    return reinterpret_cast<libusb_device_handle *>(g_handleStorage);
}

UsbEndpointInformation Endpoint(uint8_t interfaceNumber, uint8_t pipeRef, UsbTransferType type)
{
    UsbEndpointInformation information;
    information.interfaceNumber = interfaceNumber;
    information.pipeRef = pipeRef;
    information.transferType = type;
    information.maxPacketSize = 512;
    return information;
}

}

TEST_CASE("A permission-denied placeholder refuses every operation", "[interface]")
{
    LibusbInterface placeholder = LibusbInterface::DenyingPlaceholder(2);

    REQUIRE(placeholder.IsPlaceholder());
    REQUIRE(placeholder.GetNumber() == 2);

    UsbStatus claimed = placeholder.Claim();
    REQUIRE_FALSE(claimed.IsOk());
    REQUIRE(claimed.GetError().GetKind() == USB_ERROR_PERMISSION_DENIED);
    REQUIRE_FALSE(placeholder.IsClaimed());

    REQUIRE(placeholder.Unclaim().GetError().GetKind() == USB_ERROR_PERMISSION_DENIED);
    REQUIRE(placeholder.SetAlternateSetting(1).GetError().GetKind() == USB_ERROR_PERMISSION_DENIED);
    REQUIRE(placeholder.ReleaseKernelDriver().GetError().GetKind() == USB_ERROR_PERMISSION_DENIED);
    REQUIRE_FALSE(placeholder.IsClaimed());
}

TEST_CASE("An unclaimed interface needs a claim before selecting an alternate setting", "[interface]")
{
    LibusbInterface usbInterface(UnusedHandle(), 0);

    REQUIRE_FALSE(usbInterface.IsPlaceholder());
    REQUIRE_FALSE(usbInterface.IsClaimed());

    // Releasing what we never claimed leaves the OS alone.
    REQUIRE(usbInterface.Unclaim().IsOk());
    REQUIRE(usbInterface.SetAlternateSetting(1).GetError().GetKind() == USB_ERROR_INVALID_INTERFACE);
}

TEST_CASE("A moved interface hands its state to the new owner", "[interface]")
{
    std::map<uint8_t, LibusbInterface> interfaces;
    interfaces.emplace(1, LibusbInterface::DenyingPlaceholder(1));

    REQUIRE(interfaces.at(1).IsPlaceholder());
    REQUIRE(interfaces.at(1).GetNumber() == 1);
}

TEST_CASE("Endpoint resolution checks the endpoint and its interface", "[interface]")
{
    std::map<uint8_t, UsbEndpointInformation> endpoints;
    endpoints[BULK_IN] = Endpoint(0, 1, USB_TRANSFER_TYPE_BULK);
    endpoints[INTERRUPT_IN] = Endpoint(0, 2, USB_TRANSFER_TYPE_INTERRUPT);
    endpoints[ISOCHRONOUS_OUT] = Endpoint(0, 3, USB_TRANSFER_TYPE_ISOCHRONOUS);
    endpoints[DENIED_IN] = Endpoint(1, 1, USB_TRANSFER_TYPE_BULK);

    std::map<uint8_t, LibusbInterface> interfaces;
    interfaces.emplace(0, LibusbInterface(UnusedHandle(), 0));
    interfaces.emplace(1, LibusbInterface::DenyingPlaceholder(1));

    SECTION("unknown address") {
        UsbResult<UsbEndpointInformation> resolved = LibusbResolveEndpoint(0x82, endpoints, interfaces);
        REQUIRE(resolved.GetError().GetKind() == USB_ERROR_INVALID_ENDPOINT);
    }

    SECTION("isochronous endpoints are unsupported") {
        UsbResult<UsbEndpointInformation> resolved = LibusbResolveEndpoint(ISOCHRONOUS_OUT, endpoints, interfaces);
        REQUIRE(resolved.GetError().GetKind() == USB_ERROR_UNSUPPORTED);
    }

    SECTION("endpoint of a placeholder interface") {
        UsbResult<UsbEndpointInformation> resolved = LibusbResolveEndpoint(DENIED_IN, endpoints, interfaces);
        REQUIRE(resolved.GetError().GetKind() == USB_ERROR_PERMISSION_DENIED);
    }

    SECTION("endpoint of an unclaimed interface") {
        REQUIRE(LibusbResolveEndpoint(BULK_IN, endpoints, interfaces).GetError().GetKind()
            == USB_ERROR_INVALID_INTERFACE);
        REQUIRE(LibusbResolveEndpoint(INTERRUPT_IN, endpoints, interfaces).GetError().GetKind()
            == USB_ERROR_INVALID_INTERFACE);
    }
}
