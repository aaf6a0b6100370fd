#include <catch2/catch_all.hpp>

#include <memory>

#include "usb_error.hpp"

TEST_CASE("Error kinds compare by kind and OS code", "[error]")
{
    REQUIRE(UsbError(USB_ERROR_STALLED) == UsbError(USB_ERROR_STALLED));
    REQUIRE(UsbError(USB_ERROR_STALLED) != UsbError(USB_ERROR_TIMED_OUT));
    REQUIRE(UsbError::FromOsCode(-5) == UsbError::FromOsCode(-5));
    REQUIRE(UsbError::FromOsCode(-5) != UsbError::FromOsCode(-6));

    UsbError error = UsbError::FromOsCode(-99);
    REQUIRE(error.GetKind() == USB_ERROR_OS_ERROR);
    REQUIRE(error.GetOsCode() == -99);
}

TEST_CASE("Error messages name the kind", "[error]")
{
    REQUIRE(std::string(UsbErrorKindToString(USB_ERROR_OVERRUN)) == UsbError(USB_ERROR_OVERRUN).GetMessage());
    REQUIRE(UsbError::FromOsCode(-7).GetMessage().find("-7") != std::string::npos);
}

TEST_CASE("Results hold either a value or an error", "[error]")
{
    UsbResult<size_t> ok = static_cast<size_t>(18);
    REQUIRE(ok.IsOk());
    REQUIRE(static_cast<bool>(ok));
    REQUIRE(ok.GetValue() == 18);

    UsbResult<size_t> failed = USB_ERROR_TIMED_OUT;
    REQUIRE_FALSE(failed.IsOk());
    REQUIRE(failed.GetError().GetKind() == USB_ERROR_TIMED_OUT);

    UsbStatus status;
    REQUIRE(status.IsOk());

    UsbStatus denied = USB_ERROR_PERMISSION_DENIED;
    REQUIRE(denied.GetError() == UsbError(USB_ERROR_PERMISSION_DENIED));
}

TEST_CASE("Results can carry move-only values", "[error]")
{
    UsbResult<std::unique_ptr<int>> result = std::make_unique<int>(42);
    REQUIRE(result.IsOk());

    std::unique_ptr<int> value = result.TakeValue();
    REQUIRE(*value == 42);
}
