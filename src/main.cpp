#include <iostream>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <iomanip>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <cxxopts.hpp>
#include <indicators/progress_bar.hpp>

#include "usb_host.hpp"
#include "usb_host_config.hpp"
#include "usbhost_log.hpp"

static uint16_t ParseId(const std::string &value)
{
    size_t end = 0;
    unsigned long id = std::stoul(value, &end, 16);
    if (end != value.size() || id > 0xFFFF) {
        throw std::invalid_argument("invalid USB id: " + value);
    }
    return static_cast<uint16_t>(id);
}

static void PrintBytes(const std::string &label, const uint8_t *data, size_t size)
{
    std::cout << label << " (" << size << " bytes):";
    for (size_t i = 0; i < size; ++i) {
        if (i % 16 == 0) {
            std::cout << std::endl << "  ";
        }
        std::cout << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]) << " ";
    }
    std::cout << std::dec << std::endl;
}

static int ListDevices(UsbHost &host, const UsbDeviceSelector &selector)
{
    UsbResult<std::vector<UsbDeviceInformation>> devices = host.Devices(selector);
    if (!devices) {
        std::cerr << "Failed to enumerate devices: " << devices.GetError().GetMessage() << std::endl;
        return 1;
    }

    for (const UsbDeviceInformation &device : devices.GetValue()) {
        std::cout << device;
        if (device.backendStringLocation) {
            std::cout << " [" << *device.backendStringLocation << "]";
        }
        std::cout << std::endl;
    }

    return 0;
}

static int DumpDeviceDescriptor(UsbDevice &device)
{
    UsbResult<std::vector<uint8_t>> descriptor = device.ReadStandardDescriptor(USB_DESCRIPTOR_TYPE_DEVICE, 0, 18,
        std::chrono::milliseconds(1000));
    if (!descriptor) {
        std::cerr << "Failed to read device descriptor: " << descriptor.GetError().GetMessage() << std::endl;
        return 1;
    }
    PrintBytes("Device descriptor", descriptor.GetValue().data(), descriptor.GetValue().size());

    UsbReadBuffer buffer = CreateReadBuffer(18);
    UsbResult<UsbTransferFuture> future = device.ReadStandardDescriptorAsync(USB_DESCRIPTOR_TYPE_DEVICE, 0, buffer,
        std::chrono::milliseconds(1000));
    if (!future) {
        std::cerr << "Failed to submit descriptor read: " << future.GetError().GetMessage() << std::endl;
        return 1;
    }

    UsbResult<size_t> transferred = future.GetValue().Wait();
    if (!transferred) {
        std::cerr << "Asynchronous descriptor read failed: " << transferred.GetError().GetMessage() << std::endl;
        return 1;
    }
    PrintBytes("Device descriptor (async)", buffer->data(), transferred.GetValue());

    return 0;
}

static int ReadEndpoint(UsbDevice &device, uint8_t interfaceNumber, uint8_t endpoint, size_t length,
    const std::string &outputPath)
{
    UsbStatus status = device.ClaimInterface(interfaceNumber);
    if (!status) {
        std::cerr << "Failed to claim interface " << static_cast<int>(interfaceNumber) << ": "
            << status.GetError().GetMessage() << std::endl;
        return 1;
    }

    std::ofstream output;
    if (!outputPath.empty()) {
        output.open(outputPath, std::ios::binary);
        if (!output.is_open()) {
            std::cerr << "Failed to open output file: " << outputPath << std::endl;
            return 1;
        }
    }

    indicators::ProgressBar progressBar{
        indicators::option::BarWidth{50},
        indicators::option::Start{"["},
        indicators::option::Fill{"="},
        indicators::option::Lead{">"},
        indicators::option::Remainder{" "},
        indicators::option::End{"]"},
        indicators::option::PrefixText{"Endpoint " + std::to_string(endpoint) + ": "},
        indicators::option::ForegroundColor{indicators::Color::green},
        indicators::option::ShowElapsedTime{true},
        indicators::option::ShowRemainingTime{true},
        indicators::option::MaxProgress{100}
    };

    const size_t chunkSize = 16 * 1024;
    std::vector<uint8_t> chunk(chunkSize);
    size_t total = 0;

    while (total < length) {
        size_t request = std::min(chunkSize, length - total);
        UsbResult<size_t> transferred = device.Read(endpoint, chunk.data(), request, std::chrono::milliseconds(5000));
        if (!transferred) {
            std::cerr << std::endl << "Read failed after " << total << " bytes: "
                << transferred.GetError().GetMessage() << std::endl;
            return 1;
        }

        if (output.is_open()) {
            output.write(reinterpret_cast<const char *>(chunk.data()), transferred.GetValue());
        }
        total += transferred.GetValue();

        progressBar.set_progress(total * 100 / length);

        // A short packet ends the transfer.
        if (transferred.GetValue() < request) {
            break;
        }
    }

    if (!progressBar.is_completed()) {
        progressBar.mark_as_completed();
    }

    std::cout << "Read " << total << " bytes from endpoint " << static_cast<int>(endpoint) << std::endl;

    status = device.UnclaimInterface(interfaceNumber);
    if (!status) {
        std::cerr << "Failed to release interface: " << status.GetError().GetMessage() << std::endl;
        return 1;
    }

    return 0;
}

int main(int argc, char* argv[])
{
    cxxopts::Options options("usbhost", "USB device inspection utility");

    options.add_options()
        ("L,list", "List devices matching the selector", cxxopts::value<bool>()->default_value("false"))
        ("v,vid", "Vendor ID (hex)", cxxopts::value<std::string>())
        ("p,pid", "Product ID (hex)", cxxopts::value<std::string>())
        ("s,serial", "Serial number", cxxopts::value<std::string>())
        ("d,descriptor", "Read the device descriptor of the first match", cxxopts::value<bool>()->default_value("false"))
        ("e,read-endpoint", "Read from an IN endpoint of the first match", cxxopts::value<int>())
        ("n,length", "Number of bytes to read", cxxopts::value<size_t>()->default_value("512"))
        ("o,output", "File to write read data to", cxxopts::value<std::string>()->default_value(""))
        ("i,interface", "Interface to claim for reading", cxxopts::value<int>()->default_value("0"))
        ("c,config", "YAML configuration file", cxxopts::value<std::string>())
        ("l,log", "Log file path", cxxopts::value<std::string>()->default_value(""))
        ("D,debug", "Enable debug logging", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        UsbHostConfig config;
        if (result.count("config")) {
            if (config.Load(result["config"].as<std::string>()) < 0) {
                std::cerr << "Failed to load configuration" << std::endl;
                return 1;
            }
        }

        std::string logFilePath = result["log"].as<std::string>();
        if (!logFilePath.empty()) {
            config.logPath = logFilePath;
        }
        if (result["debug"].as<bool>()) {
            config.logLevel = USBHOST_LOG_LEVEL_DEBUG;
        }

        if (!config.logPath.empty()) {
            UsbHostLogStore::getInstance().Open(config.logPath, config.logLevel);
        } else {
            UsbHostLogStore::getInstance().SetMinLevel(config.logLevel);
        }

        UsbDeviceSelector selector;
        if (result.count("vid")) {
            selector.vendorId = ParseId(result["vid"].as<std::string>());
        }
        if (result.count("pid")) {
            selector.productId = ParseId(result["pid"].as<std::string>());
        }
        if (result.count("serial")) {
            selector.serial = result["serial"].as<std::string>();
        }

        UsbResult<std::unique_ptr<UsbHost>> host = UsbHost::Create(config);
        if (!host) {
            std::cerr << "Failed to create USB host: " << host.GetError().GetMessage() << std::endl;
            return 1;
        }

        bool readEndpoint = result.count("read-endpoint") > 0;
        bool descriptor = result["descriptor"].as<bool>();

        if (result["list"].as<bool>() || (!descriptor && !readEndpoint)) {
            return ListDevices(*host.GetValue(), selector);
        }

        UsbResult<UsbDeviceInformation> information = host.GetValue()->Device(selector);
        if (!information) {
            std::cerr << "No matching device: " << information.GetError().GetMessage() << std::endl;
            return 1;
        }

        UsbResult<std::unique_ptr<UsbDevice>> device = host.GetValue()->Open(information.GetValue());
        if (!device) {
            std::cerr << "Failed to open " << information.GetValue() << ": "
                << device.GetError().GetMessage() << std::endl;
            return 1;
        }

        std::cout << "Opened " << information.GetValue() << " using " << device.GetValue()->GetBackendName()
            << std::endl;

        int ret = 0;
        if (descriptor) {
            ret = DumpDeviceDescriptor(*device.GetValue());
        }

        if (ret == 0 && readEndpoint) {
            ret = ReadEndpoint(*device.GetValue(), static_cast<uint8_t>(result["interface"].as<int>()),
                static_cast<uint8_t>(result["read-endpoint"].as<int>()), result["length"].as<size_t>(),
                result["output"].as<std::string>());
        }

        return ret;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
