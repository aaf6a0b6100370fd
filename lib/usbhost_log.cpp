#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <cctype>

#include "usbhost_log.hpp"

const char *UsbHostLogLevelToString(UsbHostLogLevel level)
{
    switch (level) {
        case USBHOST_LOG_LEVEL_DEBUG:
            return "DEBUG";
        case USBHOST_LOG_LEVEL_INFO:
            return "INFO";
        case USBHOST_LOG_LEVEL_WARNING:
            return "WARNING";
        case USBHOST_LOG_LEVEL_ERROR:
            return "ERROR";
    }
    return "UNKNOWN";
}

bool UsbHostLogLevelFromString(const std::string &name, UsbHostLogLevel &level)
{
    std::string lowerName = name;
    std::transform(lowerName.begin(), lowerName.end(), lowerName.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowerName == "debug") {
        level = USBHOST_LOG_LEVEL_DEBUG;
    } else if (lowerName == "info") {
        level = USBHOST_LOG_LEVEL_INFO;
    } else if (lowerName == "warning" || lowerName == "warn") {
        level = USBHOST_LOG_LEVEL_WARNING;
    } else if (lowerName == "error") {
        level = USBHOST_LOG_LEVEL_ERROR;
    } else {
        return false;
    }

    return true;
}

UsbHostLogStore &UsbHostLogStore::getInstance()
{
    static UsbHostLogStore instance;
    return instance;
}

void UsbHostLogStore::Open(const std::string &path, UsbHostLogLevel minLevel)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    m_minLevel.store(minLevel);

    if (m_file.is_open()) {
        m_file.close();
    }

    if (!path.empty()) {
        m_file.open(path, std::ios::out | std::ios::app);
        if (!m_file) {
            std::cerr << "Failed to open log file: " << path << std::endl;
        }
    }
}

void UsbHostLogStore::Close()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_file.is_open()) {
        m_file.flush();
        m_file.close();
    }
}

void UsbHostLogStore::SetMinLevel(UsbHostLogLevel minLevel)
{
    m_minLevel.store(minLevel);
}

bool UsbHostLogStore::IsEnabled(UsbHostLogLevel level) const
{
    return static_cast<int>(level) >= m_minLevel.load();
}

void UsbHostLogStore::Write(UsbHostLogLevel level, const std::string &function, const std::string &message)
{
    auto now = std::chrono::system_clock::now();
    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm localTime{};
#if PLATFORM_WINDOWS
    localtime_s(&localTime, &nowTime);
#else
    localtime_r(&nowTime, &localTime);
#endif

    std::lock_guard<std::mutex> lock(m_mutex);

    std::ostream &out = m_file.is_open() ? static_cast<std::ostream &>(m_file) : std::cerr;
    out << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << "." << std::setw(3) << std::setfill('0') << millis
        << " [" << UsbHostLogLevelToString(level) << "] " << function << ": " << message << std::endl;
}
