#include <iostream>
#include <yaml-cpp/yaml.h>
#include <stdexcept>

#include "usb_host_config.hpp"
#include "usbhost_log.hpp"

int UsbHostConfig::Load(const std::string &path)
{
    USBHOST_LOG;

    try {
        YAML::Node config = YAML::LoadFile(path);
        UsbHostConfig loaded = *this;

        if (config["backend"]) {
            loaded.backend = config["backend"].as<std::string>();
        }
        if (config["open_retry_count"]) {
            int retries = config["open_retry_count"].as<int>();
            if (retries < 0) {
                throw std::runtime_error("open_retry_count must not be negative");
            }
            loaded.openRetryCount = retries;
        }
        if (config["open_retry_delay_ms"]) {
            loaded.openRetryDelay = std::chrono::milliseconds(config["open_retry_delay_ms"].as<unsigned int>());
        }
        if (config["event_loop_slice_ms"]) {
            unsigned int slice = config["event_loop_slice_ms"].as<unsigned int>();
            if (slice == 0) {
                throw std::runtime_error("event_loop_slice_ms must be positive");
            }
            loaded.eventLoopSlice = std::chrono::milliseconds(slice);
        }
        if (config["log_level"]) {
            std::string levelName = config["log_level"].as<std::string>();
            if (!UsbHostLogLevelFromString(levelName, loaded.logLevel)) {
                throw std::runtime_error("Invalid log level: " + levelName);
            }
        }
        if (config["log_path"]) {
            loaded.logPath = config["log_path"].as<std::string>();
        }
        if (config["libusb_debug"]) {
            loaded.libusbDebug = config["libusb_debug"].as<bool>();
        }

        *this = loaded;

        log(USBHOST_LOG_LEVEL_INFO) << "Loaded configuration: " << path << endLog;
        log(USBHOST_LOG_LEVEL_DEBUG) << "  backend: " << backend << endLog;
        log(USBHOST_LOG_LEVEL_DEBUG) << "  open retries: " << openRetryCount << " every " << openRetryDelay.count() << "ms" << endLog;
        log(USBHOST_LOG_LEVEL_DEBUG) << "  event loop slice: " << eventLoopSlice.count() << "ms" << endLog;
    } catch (const YAML::BadFile &e) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Unable to open the configuration file: " << e.what() << endLog;
        return -1;
    } catch (const std::exception &e) {
        log(USBHOST_LOG_LEVEL_ERROR) << e.what() << endLog;
        return -1;
    }

    return 0;
}
