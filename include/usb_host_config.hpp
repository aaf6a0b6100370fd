#pragma once

#include <chrono>
#include <string>

#include "usbhost_log.hpp"

struct UsbHostConfig {
    std::string backend = "libusb";

    // Freshly plugged devices can briefly report "no resources" while the OS
    // decides which driver binds to them.
    int openRetryCount = 5;
    std::chrono::milliseconds openRetryDelay{1};

    // Upper bound on how long an event loop runs before checking for shutdown.
    std::chrono::milliseconds eventLoopSlice{1000};

    UsbHostLogLevel logLevel = USBHOST_LOG_LEVEL_WARNING;
    std::string logPath;

    // Turns on libusb's own debug output.
    bool libusbDebug = false;

    // Overlays the keys present in a YAML file. Returns 0 on success, -1 on
    // a missing file or a malformed value.
    int Load(const std::string &path);
};
