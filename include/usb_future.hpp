#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "usb_error.hpp"
#include "usb_backend.hpp"

// Called when a pending future becomes ready.
using UsbWaker = std::function<void()>;

// Single completion future over the callback form of a transfer.
//
// The callback produced by MakeCallback() stores the transfer result and
// wakes whoever last polled. The result can be taken exactly once; polling
// again after that is a programming error and terminates the process.
class UsbTransferFuture {
public:
    UsbTransferFuture();

    UsbTransferFuture(UsbTransferFuture &&) = default;
    UsbTransferFuture &operator=(UsbTransferFuture &&) = default;
    UsbTransferFuture(const UsbTransferFuture &) = delete;
    UsbTransferFuture &operator=(const UsbTransferFuture &) = delete;

    // Completes this future. Hand it to exactly one non-blocking submission.
    UsbTransferCallback MakeCallback() const;

    // Returns the result once complete; otherwise registers the waker,
    // replacing any earlier one, and returns std::nullopt.
    std::optional<UsbResult<size_t>> Poll(UsbWaker waker);

    bool IsReady() const;

    // False once the future has been moved from.
    bool IsValid() const;

    // Blocks until the result is available.
    UsbResult<size_t> Wait();

    // Like Wait(), but gives up after the timeout. The future stays usable.
    std::optional<UsbResult<size_t>> WaitFor(std::chrono::milliseconds timeout);

private:
    struct State {
        std::mutex mutex;
        bool pending = true;
        bool taken = false;
        std::optional<UsbResult<size_t>> result;
        UsbWaker waker;

        void Complete(UsbResult<size_t> transferResult);
    };

    std::shared_ptr<State> m_state;

    State &GetState() const;
};
