#include <catch2/catch_all.hpp>

#include <cstring>
#include <optional>
#include <stdexcept>
#include <thread>

#include "usb_transfer_bridge.hpp"

namespace {

class CountingTracker : public UsbTransferTracker {
public:
    void TransferRetired(libusb_transfer *transfer) override
    {
        retired = transfer;
    }

    void TransferFinished() override
    {
        finished++;
    }

    libusb_transfer *retired = nullptr;
    int finished = 0;
};

std::unique_ptr<UsbPendingTransfer> MakePending(UsbTransferCallback callback)
{
    auto pending = std::make_unique<UsbPendingTransfer>();
    pending->transfer.reset(libusb_alloc_transfer(0));
    REQUIRE(pending->transfer != nullptr);
    pending->callback = std::move(callback);
    return pending;
}

}

TEST_CASE("A leaked pending transfer is reclaimed from its token", "[bridge]")
{
    std::unique_ptr<UsbPendingTransfer> pending = MakePending([](UsbResult<size_t>) {});
    UsbPendingTransfer *raw = pending.get();

    libusb_transfer *transfer = LeakPendingTransfer(std::move(pending));
    REQUIRE(transfer->user_data == raw);

    std::unique_ptr<UsbPendingTransfer> reclaimed = ReclaimPendingTransfer(transfer);
    REQUIRE(reclaimed.get() == raw);
    REQUIRE(transfer->user_data == nullptr);
}

TEST_CASE("The trampoline delivers a completed read exactly once", "[bridge]")
{
    std::optional<UsbResult<size_t>> delivered;
    int calls = 0;

    std::unique_ptr<UsbPendingTransfer> pending = MakePending([&](UsbResult<size_t> result) {
        calls++;
        delivered.emplace(std::move(result));
    });

    CountingTracker tracker;
    pending->tracker = &tracker;
    pending->buffer.assign(8, 0);
    pending->readBuffer = CreateReadBuffer(8);

    libusb_fill_bulk_transfer(pending->transfer.get(), nullptr, 0x81, pending->buffer.data(),
        static_cast<int>(pending->buffer.size()), UsbTransferTrampoline, nullptr, 0);

    const uint8_t payload[] = {1, 2, 3, 4, 5};
    std::memcpy(pending->buffer.data(), payload, sizeof(payload));
    pending->transfer->status = LIBUSB_TRANSFER_COMPLETED;
    pending->transfer->actual_length = sizeof(payload);

    UsbReadBuffer readBuffer = pending->readBuffer;
    libusb_transfer *transfer = LeakPendingTransfer(std::move(pending));

    UsbTransferTrampoline(transfer);

    REQUIRE(calls == 1);
    REQUIRE(delivered.has_value());
    REQUIRE(delivered->GetValue() == sizeof(payload));
    REQUIRE(std::memcmp(readBuffer->data(), payload, sizeof(payload)) == 0);
    REQUIRE(tracker.retired == transfer);
    REQUIRE(tracker.finished == 1);
}

TEST_CASE("The trampoline copies control data past the setup packet", "[bridge]")
{
    std::optional<UsbResult<size_t>> delivered;

    std::unique_ptr<UsbPendingTransfer> pending = MakePending([&](UsbResult<size_t> result) {
        delivered.emplace(std::move(result));
    });

    pending->buffer.assign(LIBUSB_CONTROL_SETUP_SIZE + 4, 0);
    pending->readBuffer = CreateReadBuffer(4);
    pending->isControl = true;

    libusb_fill_control_setup(pending->buffer.data(), 0x80, 6, 0x0100, 0, 4);
    libusb_fill_control_transfer(pending->transfer.get(), nullptr, pending->buffer.data(), UsbTransferTrampoline,
        nullptr, 0);

    pending->buffer[LIBUSB_CONTROL_SETUP_SIZE] = 18;
    pending->buffer[LIBUSB_CONTROL_SETUP_SIZE + 1] = 1;
    pending->transfer->status = LIBUSB_TRANSFER_COMPLETED;
    pending->transfer->actual_length = 2;

    UsbReadBuffer readBuffer = pending->readBuffer;
    UsbTransferTrampoline(LeakPendingTransfer(std::move(pending)));

    REQUIRE(delivered.has_value());
    REQUIRE(delivered->GetValue() == 2);
    REQUIRE((*readBuffer)[0] == 18);
    REQUIRE((*readBuffer)[1] == 1);
}

TEST_CASE("A cancelled transfer reports Aborted and a throwing callback is contained", "[bridge]")
{
    int calls = 0;
    CountingTracker tracker;

    std::unique_ptr<UsbPendingTransfer> pending = MakePending([&calls](UsbResult<size_t> result) {
        calls++;
        REQUIRE(result.GetError().GetKind() == USB_ERROR_ABORTED);
        throw std::runtime_error("callback failure");
    });
    pending->tracker = &tracker;
    pending->transfer->status = LIBUSB_TRANSFER_CANCELLED;

    UsbTransferTrampoline(LeakPendingTransfer(std::move(pending)));

    REQUIRE(calls == 1);
    REQUIRE(tracker.finished == 1);
}

TEST_CASE("A callback that throws a non-standard type is contained", "[bridge]")
{
    int calls = 0;
    CountingTracker tracker;

    std::unique_ptr<UsbPendingTransfer> pending = MakePending([&calls](UsbResult<size_t>) {
        calls++;
        throw 42;
    });
    pending->tracker = &tracker;
    pending->transfer->status = LIBUSB_TRANSFER_ERROR;

    UsbTransferTrampoline(LeakPendingTransfer(std::move(pending)));

    REQUIRE(calls == 1);
    REQUIRE(tracker.finished == 1);
}

TEST_CASE("A completion reaped on another thread runs its callback on the event loop", "[bridge]")
{
    UsbEventLoop loop("bridge", std::chrono::milliseconds(1000));
    loop.Start();
    std::thread::id loopThread = loop.GetThreadId();

    int calls = 0;
    std::thread::id callbackThread;
    std::optional<UsbResult<size_t>> delivered;
    CountingTracker tracker;

    std::unique_ptr<UsbPendingTransfer> pending = MakePending([&](UsbResult<size_t> result) {
        calls++;
        callbackThread = std::this_thread::get_id();
        delivered.emplace(std::move(result));
    });
    pending->tracker = &tracker;
    pending->completionLoop = &loop;
    pending->buffer.assign(8, 0x5a);
    pending->readBuffer = CreateReadBuffer(8);

    libusb_fill_bulk_transfer(pending->transfer.get(), nullptr, 0x81, pending->buffer.data(),
        static_cast<int>(pending->buffer.size()), UsbTransferTrampoline, nullptr, 0);
    pending->transfer->status = LIBUSB_TRANSFER_COMPLETED;
    pending->transfer->actual_length = 3;

    UsbReadBuffer readBuffer = pending->readBuffer;
    libusb_transfer *transfer = LeakPendingTransfer(std::move(pending));

    // Stands in for a blocking call that handles events on the same context.
    std::thread::id reaperThread;
    std::thread reaper([&]() {
        reaperThread = std::this_thread::get_id();
        UsbTransferTrampoline(transfer);
    });
    reaper.join();

    // Stop runs the tasks already posted before joining the loop thread.
    loop.Stop();

    REQUIRE(tracker.retired == transfer);
    REQUIRE(calls == 1);
    REQUIRE(callbackThread == loopThread);
    REQUIRE(callbackThread != reaperThread);
    REQUIRE(delivered.has_value());
    REQUIRE(delivered->GetValue() == 3);
    REQUIRE((*readBuffer)[2] == 0x5a);
    REQUIRE(tracker.finished == 1);
}

TEST_CASE("A completion is delivered in place once the event loop is gone", "[bridge]")
{
    UsbEventLoop loop("bridge", std::chrono::milliseconds(1000));

    int calls = 0;
    std::thread::id callbackThread;
    CountingTracker tracker;

    std::unique_ptr<UsbPendingTransfer> pending = MakePending([&](UsbResult<size_t> result) {
        calls++;
        callbackThread = std::this_thread::get_id();
        REQUIRE(result.GetError().GetKind() == USB_ERROR_ABORTED);
    });
    pending->tracker = &tracker;
    pending->completionLoop = &loop;
    pending->transfer->status = LIBUSB_TRANSFER_CANCELLED;

    UsbTransferTrampoline(LeakPendingTransfer(std::move(pending)));

    REQUIRE(calls == 1);
    REQUIRE(callbackThread == std::this_thread::get_id());
    REQUIRE(tracker.finished == 1);
}
