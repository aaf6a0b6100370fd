#include <algorithm>
#include <cstring>
#include <exception>

#include "usb_transfer_bridge.hpp"
#include "libusb_utils.hpp"
#include "usbhost_log.hpp"

namespace {

// Reports TransferFinished even if the callback throws.
class TransferFinishedGuard {
public:
    explicit TransferFinishedGuard(UsbTransferTracker *tracker) : m_tracker{tracker}
    {}
    ~TransferFinishedGuard()
    {
        if (m_tracker) {
            m_tracker->TransferFinished();
        }
    }

private:
    UsbTransferTracker *m_tracker;
};

UsbResult<size_t> CollectTransferResult(UsbPendingTransfer &pending)
{
    libusb_transfer *transfer = pending.transfer.get();

    UsbResult<size_t> result = UsbResultFromTransferStatus(transfer->status, transfer->actual_length);
    if (!result || !pending.readBuffer) {
        return result;
    }

    const uint8_t *data = pending.isControl ? libusb_control_transfer_get_data(transfer) : transfer->buffer;
    size_t length = std::min(result.GetValue(), pending.readBuffer->size());
    if (length > 0) {
        std::memcpy(pending.readBuffer->data(), data, length);
    }

    return length;
}

void DeliverTransferResult(UsbTransferTracker *tracker, const UsbTransferCallback &callback,
    UsbResult<size_t> result)
{
    USBHOST_LOG;

    TransferFinishedGuard finished(tracker);

    if (!callback) {
        return;
    }

    // An exception must not unwind through libusb's C frames.
    try {
        callback(std::move(result));
    } catch (const std::exception &e) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Transfer callback threw: " << e.what() << endLog;
    } catch (...) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Transfer callback threw an unknown exception" << endLog;
    }
}

}

libusb_transfer *LeakPendingTransfer(std::unique_ptr<UsbPendingTransfer> pending)
{
    if (!pending || !pending->transfer) {
        UsbHostFatal("leaking a pending transfer without a libusb transfer");
    }

    libusb_transfer *transfer = pending->transfer.get();
    transfer->user_data = pending.release();
    return transfer;
}

std::unique_ptr<UsbPendingTransfer> ReclaimPendingTransfer(libusb_transfer *transfer)
{
    if (transfer == nullptr) {
        UsbHostFatal("libusb completed a null transfer");
    }

    if (transfer->user_data == nullptr) {
        UsbHostFatal("pending transfer reclaimed twice");
    }

    std::unique_ptr<UsbPendingTransfer> pending(static_cast<UsbPendingTransfer *>(transfer->user_data));
    transfer->user_data = nullptr;

    if (pending->transfer.get() != transfer) {
        UsbHostFatal("pending transfer token does not belong to its libusb transfer");
    }

    return pending;
}

int SubmitPendingTransfer(std::unique_ptr<UsbPendingTransfer> pending)
{
    libusb_transfer *transfer = LeakPendingTransfer(std::move(pending));

    int ret = libusb_submit_transfer(transfer);
    if (ret < 0) {
        std::unique_ptr<UsbPendingTransfer> rejected = ReclaimPendingTransfer(transfer);
        rejected->callback = nullptr;
    }

    return ret;
}

void LIBUSB_CALL UsbTransferTrampoline(libusb_transfer *transfer)
{
    USBHOST_LOG;

    std::unique_ptr<UsbPendingTransfer> pending = ReclaimPendingTransfer(transfer);
    UsbTransferTracker *tracker = pending->tracker;
    UsbEventLoop *completionLoop = pending->completionLoop;

    if (tracker) {
        tracker->TransferRetired(transfer);
    }

    UsbResult<size_t> result = CollectTransferResult(*pending);
    if (!result) {
        log(USBHOST_LOG_LEVEL_DEBUG) << "Transfer on endpoint 0x" << std::hex << static_cast<int>(transfer->endpoint)
            << std::dec << " failed: " << result.GetError().GetMessage() << endLog;
    }

    UsbTransferCallback callback = std::move(pending->callback);
    pending.reset();

    if (completionLoop && !completionLoop->IsLoopThread()) {
        bool posted = completionLoop->Post([tracker, callback, result]() {
            DeliverTransferResult(tracker, callback, result);
        });
        if (posted) {
            return;
        }

        // Only a device that is shutting down pumps its own events.
        log(USBHOST_LOG_LEVEL_DEBUG) << "Event loop stopped, delivering completion in place" << endLog;
    }

    DeliverTransferResult(tracker, callback, std::move(result));
}
