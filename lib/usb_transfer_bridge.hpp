#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include <libusb-1.0/libusb.h>

#include "usb_backend.hpp"
#include "usb_event_loop.hpp"
#include "libusb_handles.hpp"

// Bookkeeping hooks for the owner of in-flight transfers.
class UsbTransferTracker {
public:
    virtual ~UsbTransferTracker()
    {}

    // The transfer is no longer in flight and must not be cancelled anymore.
    // Called on whichever thread libusb reaped the transfer on, before the
    // callback runs.
    virtual void TransferRetired(libusb_transfer *transfer) = 0;

    // The callback has returned and the transfer has been freed.
    virtual void TransferFinished() = 0;
};

// Everything a non-blocking transfer owns while libusb holds it.
struct UsbPendingTransfer {
    LibusbTransferPtr transfer;
    UsbTransferCallback callback;

    // Memory handed to libusb. For control transfers this starts with the
    // 8 byte setup packet.
    std::vector<uint8_t> buffer;

    // Where the data of an IN transfer ends up; null for OUT transfers.
    UsbReadBuffer readBuffer;

    bool isControl = false;
    UsbTransferTracker *tracker = nullptr;

    // Thread the callback must run on. A blocking libusb call on another
    // thread can reap this transfer too; its callback is then posted here.
    UsbEventLoop *completionLoop = nullptr;
};

// Moves ownership of the pending transfer into the opaque user_data token of
// its libusb_transfer. This is the only place a pending transfer is leaked.
libusb_transfer *LeakPendingTransfer(std::unique_ptr<UsbPendingTransfer> pending);

// Takes ownership back from the token and clears it. This is the only place
// a pending transfer is reclaimed; reclaiming the same token twice is fatal.
std::unique_ptr<UsbPendingTransfer> ReclaimPendingTransfer(libusb_transfer *transfer);

// Leaks the pending transfer into libusb and submits it. On failure the
// token is reclaimed right away and the callback is dropped uninvoked.
// Returns the libusb result code.
int SubmitPendingTransfer(std::unique_ptr<UsbPendingTransfer> pending);

// Completion function handed to libusb for every non-blocking transfer.
void LIBUSB_CALL UsbTransferTrampoline(libusb_transfer *transfer);
