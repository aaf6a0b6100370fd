#pragma once

#include <string>
#include <sstream>
#include <fstream>
#include <mutex>
#include <atomic>

enum UsbHostLogLevel {
    USBHOST_LOG_LEVEL_DEBUG,
    USBHOST_LOG_LEVEL_INFO,
    USBHOST_LOG_LEVEL_WARNING,
    USBHOST_LOG_LEVEL_ERROR,
};

const char *UsbHostLogLevelToString(UsbHostLogLevel level);
bool UsbHostLogLevelFromString(const std::string &name, UsbHostLogLevel &level);

// Process wide log sink. Messages go to the file passed to Open(), or to
// std::cerr when no file is open.
class UsbHostLogStore {
public:
    static UsbHostLogStore &getInstance();

    void Open(const std::string &path, UsbHostLogLevel minLevel);
    void Close();

    void SetMinLevel(UsbHostLogLevel minLevel);
    bool IsEnabled(UsbHostLogLevel level) const;

    void Write(UsbHostLogLevel level, const std::string &function, const std::string &message);

private:
    UsbHostLogStore() = default;
    UsbHostLogStore(const UsbHostLogStore &) = delete;
    UsbHostLogStore &operator=(const UsbHostLogStore &) = delete;

    std::mutex m_mutex;
    std::ofstream m_file;
    std::atomic<int> m_minLevel{USBHOST_LOG_LEVEL_WARNING};
};

struct UsbHostLogEnd {};
inline constexpr UsbHostLogEnd endLog{};

class UsbHostLog {
public:
    explicit UsbHostLog(const char *function) : m_function{function}
    {}

    UsbHostLog &operator()(UsbHostLogLevel level)
    {
        m_level = level;
        m_stream.str("");
        m_stream.clear();
        return *this;
    }

    template <typename T>
    UsbHostLog &operator<<(const T &value)
    {
        m_stream << value;
        return *this;
    }

    UsbHostLog &operator<<(const UsbHostLogEnd &)
    {
        UsbHostLogStore &store = UsbHostLogStore::getInstance();
        if (store.IsEnabled(m_level)) {
            store.Write(m_level, m_function, m_stream.str());
        }
        m_stream.str("");
        m_stream.clear();
        return *this;
    }

private:
    const char *m_function;
    UsbHostLogLevel m_level = USBHOST_LOG_LEVEL_INFO;
    std::ostringstream m_stream;
};

#define USBHOST_LOG UsbHostLog log(__FUNCTION__)
