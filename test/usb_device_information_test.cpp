#include <catch2/catch_all.hpp>

#include <sstream>

#include "usb_device_information.hpp"

static UsbDeviceInformation MakeInformation(uint16_t vendorId, uint16_t productId,
    std::optional<std::string> serial)
{
    UsbDeviceInformation information;
    information.vendorId = vendorId;
    information.productId = productId;
    information.serial = serial;
    return information;
}

TEST_CASE("An empty selector matches every device", "[selector]")
{
    UsbDeviceSelector selector;

    auto vendorId = GENERATE(as<uint16_t>{}, 0x0000, 0x1d50, 0xffff);
    auto productId = GENERATE(as<uint16_t>{}, 0x0000, 0x615c);

    REQUIRE(selector.Matches(MakeInformation(vendorId, productId, std::nullopt)));
    REQUIRE(selector.Matches(MakeInformation(vendorId, productId, std::string("ABC123"))));
}

TEST_CASE("A selector field that disagrees rejects the device", "[selector]")
{
    UsbDeviceInformation device = MakeInformation(0x1d50, 0x615c, std::string("ABC123"));

    SECTION("vendor id") {
        UsbDeviceSelector selector;
        selector.vendorId = 0x1d51;
        REQUIRE_FALSE(selector.Matches(device));
    }

    SECTION("product id") {
        UsbDeviceSelector selector;
        selector.vendorId = 0x1d50;
        selector.productId = 0x615d;
        REQUIRE_FALSE(selector.Matches(device));
    }

    SECTION("serial") {
        UsbDeviceSelector selector;
        selector.serial = "ABC124";
        REQUIRE_FALSE(selector.Matches(device));
    }

    SECTION("serial on a device without one") {
        UsbDeviceSelector selector;
        selector.serial = "ABC123";
        REQUIRE_FALSE(selector.Matches(MakeInformation(0x1d50, 0x615c, std::nullopt)));
    }
}

TEST_CASE("A selector matches when every set field agrees", "[selector]")
{
    UsbDeviceSelector selector;
    selector.vendorId = 0x1d50;
    selector.productId = 0x615c;
    selector.serial = "ABC123";

    REQUIRE(selector.Matches(MakeInformation(0x1d50, 0x615c, std::string("ABC123"))));
}

TEST_CASE("Device information prints its ids and strings", "[selector]")
{
    UsbDeviceInformation device = MakeInformation(0x1d50, 0x615c, std::string("ABC123"));
    device.vendor = "Great Scott Gadgets";

    std::ostringstream os;
    os << device;

    REQUIRE(os.str() == "1d50:615c Great Scott Gadgets [Unknown Product] (ABC123)");
}
