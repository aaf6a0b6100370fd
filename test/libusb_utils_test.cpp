#include <catch2/catch_all.hpp>

#include <chrono>
#include <limits>
#include <vector>

#include "libusb_utils.hpp"

using namespace std::chrono_literals;

TEST_CASE("libusb return codes map onto error kinds", "[libusb]")
{
    REQUIRE(UsbErrorFromLibusb(LIBUSB_ERROR_ACCESS).GetKind() == USB_ERROR_PERMISSION_DENIED);
    REQUIRE(UsbErrorFromLibusb(LIBUSB_ERROR_NO_DEVICE).GetKind() == USB_ERROR_DEVICE_NOT_FOUND);
    REQUIRE(UsbErrorFromLibusb(LIBUSB_ERROR_NOT_FOUND).GetKind() == USB_ERROR_DEVICE_NOT_FOUND);
    REQUIRE(UsbErrorFromLibusb(LIBUSB_ERROR_BUSY).GetKind() == USB_ERROR_DEVICE_RESERVED);
    REQUIRE(UsbErrorFromLibusb(LIBUSB_ERROR_TIMEOUT).GetKind() == USB_ERROR_TIMED_OUT);
    REQUIRE(UsbErrorFromLibusb(LIBUSB_ERROR_OVERFLOW).GetKind() == USB_ERROR_OVERRUN);
    REQUIRE(UsbErrorFromLibusb(LIBUSB_ERROR_PIPE).GetKind() == USB_ERROR_STALLED);
    REQUIRE(UsbErrorFromLibusb(LIBUSB_ERROR_INVALID_PARAM).GetKind() == USB_ERROR_INVALID_ARGUMENT);
    REQUIRE(UsbErrorFromLibusb(LIBUSB_ERROR_NOT_SUPPORTED).GetKind() == USB_ERROR_UNSUPPORTED);

    // A success code on a failure path has no explanation to offer.
    REQUIRE(UsbErrorFromLibusb(LIBUSB_SUCCESS).GetKind() == USB_ERROR_UNSPECIFIED_OS_ERROR);

    UsbError other = UsbErrorFromLibusb(LIBUSB_ERROR_IO);
    REQUIRE(other.GetKind() == USB_ERROR_OS_ERROR);
    REQUIRE(other.GetOsCode() == LIBUSB_ERROR_IO);

    REQUIRE(UsbStatusFromLibusb(0).IsOk());
    REQUIRE(UsbStatusFromLibusb(LIBUSB_ERROR_PIPE).GetError().GetKind() == USB_ERROR_STALLED);
}

TEST_CASE("Cancelling a transfer with nothing left to cancel succeeds", "[libusb]")
{
    REQUIRE(LibusbCancelTransferStatus(LIBUSB_SUCCESS) == LIBUSB_SUCCESS);
    REQUIRE(LibusbCancelTransferStatus(LIBUSB_ERROR_NOT_FOUND) == LIBUSB_SUCCESS);
    REQUIRE(LibusbCancelTransferStatus(LIBUSB_ERROR_NO_DEVICE) == LIBUSB_SUCCESS);
    REQUIRE(LibusbCancelTransferStatus(LIBUSB_ERROR_IO) == LIBUSB_ERROR_IO);
}

TEST_CASE("Opening retries only while the device reports no resources", "[libusb]")
{
    SECTION("gives up without a trailing sleep") {
        int calls = 0;
        auto start = std::chrono::steady_clock::now();
        int ret = LibusbRetryNoResources([&calls]() {
            calls++;
            return static_cast<int>(LIBUSB_ERROR_NO_MEM);
        }, 1, 200ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(ret == LIBUSB_ERROR_NO_MEM);
        REQUIRE(calls == 2);
        REQUIRE(elapsed >= 200ms);
        REQUIRE(elapsed < 350ms);
    }

    SECTION("stops at the first other result") {
        std::vector<int> results = {LIBUSB_ERROR_NO_MEM, LIBUSB_ERROR_ACCESS, LIBUSB_SUCCESS};
        size_t calls = 0;
        int ret = LibusbRetryNoResources([&]() {
            return results[calls++];
        }, 5, 1ms);

        REQUIRE(ret == LIBUSB_ERROR_ACCESS);
        REQUIRE(calls == 2);
    }

    SECTION("no retries") {
        int calls = 0;
        int ret = LibusbRetryNoResources([&calls]() {
            calls++;
            return static_cast<int>(LIBUSB_ERROR_NO_MEM);
        }, 0, 1000ms);

        REQUIRE(ret == LIBUSB_ERROR_NO_MEM);
        REQUIRE(calls == 1);
    }
}

TEST_CASE("Transfer status maps onto results", "[libusb]")
{
    UsbResult<size_t> completed = UsbResultFromTransferStatus(LIBUSB_TRANSFER_COMPLETED, 42);
    REQUIRE(completed.IsOk());
    REQUIRE(completed.GetValue() == 42);

    REQUIRE(UsbResultFromTransferStatus(LIBUSB_TRANSFER_CANCELLED, 0).GetError().GetKind() == USB_ERROR_ABORTED);
    REQUIRE(UsbResultFromTransferStatus(LIBUSB_TRANSFER_STALL, 0).GetError().GetKind() == USB_ERROR_STALLED);
    REQUIRE(UsbResultFromTransferStatus(LIBUSB_TRANSFER_TIMED_OUT, 0).GetError().GetKind() == USB_ERROR_TIMED_OUT);
    REQUIRE(UsbResultFromTransferStatus(LIBUSB_TRANSFER_NO_DEVICE, 0).GetError().GetKind()
        == USB_ERROR_DEVICE_NOT_FOUND);
    REQUIRE(UsbResultFromTransferStatus(LIBUSB_TRANSFER_OVERFLOW, 0).GetError().GetKind() == USB_ERROR_OVERRUN);
}

TEST_CASE("Timeouts translate to libusb milliseconds", "[libusb]")
{
    SECTION("none waits forever") {
        REQUIRE(LibusbTimeoutFromUsbTimeout(std::nullopt) == 0);
    }

    SECTION("zero does not turn into forever") {
        REQUIRE(LibusbTimeoutFromUsbTimeout(0ms) == 1);
    }

    SECTION("ordinary values pass through") {
        REQUIRE(LibusbTimeoutFromUsbTimeout(1500ms) == 1500);
    }

    SECTION("huge values saturate") {
        UsbTimeout huge = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::hours(24 * 365 * 1000));
        REQUIRE(LibusbTimeoutFromUsbTimeout(huge) == std::numeric_limits<unsigned int>::max());
    }
}
