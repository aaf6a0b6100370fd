#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Background thread that delivers a device's asynchronous completions.
//
// With a pump function the thread repeatedly hands a time slice to the OS
// event source (for example libusb_handle_events); without one it simply
// waits for posted tasks. Stop() wakes the thread immediately through the
// wake function, runs the tasks that were already posted, and joins it.
class UsbEventLoop {
public:
    // Processes OS events for at most one slice. Returning false ends the loop.
    using PumpFunction = std::function<bool(std::chrono::milliseconds slice)>;
    // Makes a blocked PumpFunction return early.
    using WakeFunction = std::function<void()>;
    using Task = std::function<void()>;

    UsbEventLoop(const std::string &name, std::chrono::milliseconds slice,
        PumpFunction pump = nullptr, WakeFunction wake = nullptr);
    ~UsbEventLoop();

    UsbEventLoop(const UsbEventLoop &) = delete;
    UsbEventLoop &operator=(const UsbEventLoop &) = delete;

    void Start();

    // Must not be called from the loop thread.
    void Stop();

    // Queues a task for the loop thread. Returns false once Stop() has begun.
    bool Post(Task task);

    bool IsRunning() const;
    bool IsLoopThread() const;
    std::thread::id GetThreadId() const;

private:
    std::string m_name;
    std::chrono::milliseconds m_slice;
    PumpFunction m_pump;
    WakeFunction m_wake;

    std::thread m_thread;
    std::thread::id m_threadId;
    std::atomic<bool> m_running{false};

    mutable std::mutex m_mutex;
    std::condition_variable m_tasksCV;
    std::deque<Task> m_tasks;
    bool m_stopRequested = false;

    void EventThread();
};
