#include "usb_future.hpp"

namespace {

struct WaitSignal {
    std::mutex mutex;
    std::condition_variable cv;
    bool woken = false;
};

UsbWaker MakeSignalWaker(const std::shared_ptr<WaitSignal> &signal)
{
    return [signal]() {
        {
            std::lock_guard<std::mutex> lock(signal->mutex);
            signal->woken = true;
        }
        signal->cv.notify_all();
    };
}

}

void UsbTransferFuture::State::Complete(UsbResult<size_t> transferResult)
{
    UsbWaker wakerToCall;

    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!pending) {
            UsbHostFatal("transfer future completed twice");
        }

        result.emplace(std::move(transferResult));
        pending = false;

        wakerToCall = std::move(waker);
        waker = nullptr;
    }

    if (wakerToCall) {
        wakerToCall();
    }
}

UsbTransferFuture::UsbTransferFuture() : m_state{std::make_shared<State>()}
{}

UsbTransferFuture::State &UsbTransferFuture::GetState() const
{
    if (!m_state) {
        UsbHostFatal("transfer future used after it was moved from");
    }
    return *m_state;
}

bool UsbTransferFuture::IsValid() const
{
    return m_state != nullptr;
}

UsbTransferCallback UsbTransferFuture::MakeCallback() const
{
    GetState();
    std::shared_ptr<State> state = m_state;
    return [state](UsbResult<size_t> result) {
        state->Complete(std::move(result));
    };
}

std::optional<UsbResult<size_t>> UsbTransferFuture::Poll(UsbWaker waker)
{
    State &state = GetState();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (state.pending) {
        state.waker = std::move(waker);
        return std::nullopt;
    }

    if (state.taken || !state.result) {
        UsbHostFatal("transfer future polled after its result was taken");
    }

    state.taken = true;
    std::optional<UsbResult<size_t>> result = std::move(state.result);
    state.result.reset();
    return result;
}

bool UsbTransferFuture::IsReady() const
{
    State &state = GetState();
    std::lock_guard<std::mutex> lock(state.mutex);
    return !state.pending && !state.taken;
}

UsbResult<size_t> UsbTransferFuture::Wait()
{
    auto signal = std::make_shared<WaitSignal>();

    for (;;) {
        std::optional<UsbResult<size_t>> result = Poll(MakeSignalWaker(signal));
        if (result) {
            return std::move(*result);
        }

        std::unique_lock<std::mutex> lock(signal->mutex);
        signal->cv.wait(lock, [&signal] { return signal->woken; });
        signal->woken = false;
    }
}

std::optional<UsbResult<size_t>> UsbTransferFuture::WaitFor(std::chrono::milliseconds timeout)
{
    auto signal = std::make_shared<WaitSignal>();
    auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        std::optional<UsbResult<size_t>> result = Poll(MakeSignalWaker(signal));
        if (result) {
            return result;
        }

        std::unique_lock<std::mutex> lock(signal->mutex);
        if (!signal->cv.wait_until(lock, deadline, [&signal] { return signal->woken; })) {
            return std::nullopt;
        }
        signal->woken = false;
    }
}
