#include <iostream>

#include "usb_event_loop.hpp"
#include "usb_error.hpp"
#include "usbhost_log.hpp"

UsbEventLoop::UsbEventLoop(const std::string &name, std::chrono::milliseconds slice,
    PumpFunction pump, WakeFunction wake)
    : m_name{name}, m_slice{slice}, m_pump{pump}, m_wake{wake}
{}

UsbEventLoop::~UsbEventLoop()
{
    Stop();
}

void UsbEventLoop::Start()
{
    USBHOST_LOG;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_thread.joinable()) {
        return;
    }

    m_stopRequested = false;
    m_running.store(true);
    m_thread = std::thread(&UsbEventLoop::EventThread, this);
    m_threadId = m_thread.get_id();

    log(USBHOST_LOG_LEVEL_DEBUG) << "Started event loop " << m_name << endLog;
}

void UsbEventLoop::Stop()
{
    USBHOST_LOG;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_thread.joinable()) {
            return;
        }
        if (std::this_thread::get_id() == m_threadId) {
            UsbHostFatal("event loop " + m_name + " asked to stop from its own thread");
        }
        m_stopRequested = true;
    }

    m_tasksCV.notify_all();
    if (m_wake) {
        m_wake();
    }

    m_thread.join();
    m_running.store(false);

    log(USBHOST_LOG_LEVEL_DEBUG) << "Stopped event loop " << m_name << endLog;
}

bool UsbEventLoop::Post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopRequested || !m_thread.joinable() || !m_running.load()) {
            return false;
        }
        m_tasks.push_back(std::move(task));
    }

    m_tasksCV.notify_one();
    if (m_wake) {
        m_wake();
    }

    return true;
}

bool UsbEventLoop::IsRunning() const
{
    return m_running.load();
}

bool UsbEventLoop::IsLoopThread() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_thread.joinable() && std::this_thread::get_id() == m_threadId;
}

std::thread::id UsbEventLoop::GetThreadId() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadId;
}

void UsbEventLoop::EventThread()
{
    USBHOST_LOG;

    for (;;) {
        std::deque<Task> tasks;
        bool stopping;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_pump) {
                m_tasksCV.wait_for(lock, m_slice, [this] { return m_stopRequested || !m_tasks.empty(); });
            }
            stopping = m_stopRequested;
            tasks.swap(m_tasks);
        }

        for (auto &task : tasks) {
            task();
        }

        if (stopping) {
            break;
        }

        if (m_pump && !m_pump(m_slice)) {
            log(USBHOST_LOG_LEVEL_ERROR) << "Event source for " << m_name << " failed, leaving event loop" << endLog;
            break;
        }
    }

    m_running.store(false);
}
