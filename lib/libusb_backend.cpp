#include <iostream>
#include <iomanip>
#include <optional>
#include <string>

#include "libusb_backend.hpp"
#include "libusb_device.hpp"
#include "libusb_utils.hpp"
#include "usbhost_log.hpp"

LibusbBackend::LibusbBackend(LibusbContextPtr context, const UsbHostConfig &config)
    : m_context{std::move(context)}, m_config{config}
{}

LibusbBackend::~LibusbBackend()
{
    USBHOST_LOG;

    log(USBHOST_LOG_LEVEL_DEBUG) << "Releasing libusb enumeration context" << endLog;
}

UsbResult<std::shared_ptr<LibusbBackend>> LibusbBackend::Create(const UsbHostConfig &config)
{
    USBHOST_LOG;

    libusb_context *rawContext = nullptr;
    int ret = libusb_init(&rawContext);
    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to initialize libusb: " << libusb_error_name(ret) << endLog;
        return UsbErrorFromLibusb(ret);
    }
    LibusbContextPtr context(rawContext);

    if (config.libusbDebug) {
        libusb_set_option(context.get(), LIBUSB_OPTION_LOG_LEVEL, LIBUSB_LOG_LEVEL_DEBUG);
    }

    const libusb_version *version = libusb_get_version();
    log(USBHOST_LOG_LEVEL_DEBUG) << "Using libusb " << version->major << "." << version->minor << "."
        << version->micro << endLog;

    return std::shared_ptr<LibusbBackend>(new LibusbBackend(std::move(context), config));
}

const char *LibusbBackend::GetName() const
{
    return "libusb";
}

UsbResult<std::vector<UsbDeviceInformation>> LibusbBackend::GetDevices()
{
    USBHOST_LOG;

    std::lock_guard<std::mutex> lock(m_contextMutex);

    LibusbDeviceList deviceList;
    ssize_t count = deviceList.Load(m_context.get());
    if (count < 0) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to get device list: " << libusb_error_name(static_cast<int>(count)) << endLog;
        return UsbErrorFromLibusb(static_cast<int>(count));
    }

    std::vector<UsbDeviceInformation> devices;
    for (size_t i = 0; i < deviceList.Size(); ++i) {
        UsbResult<UsbDeviceInformation> information = DescribeDevice(deviceList[i]);
        if (!information) {
            log(USBHOST_LOG_LEVEL_DEBUG) << "Skipping " << LibusbPortPathFor(deviceList[i]) << ": "
                << information.GetError().GetMessage() << endLog;
            continue;
        }
        devices.push_back(information.TakeValue());
    }

    log(USBHOST_LOG_LEVEL_DEBUG) << "Found " << devices.size() << " of " << deviceList.Size() << " devices" << endLog;

    return devices;
}

UsbResult<UsbDeviceInformation> LibusbBackend::DescribeDevice(libusb_device *device)
{
    USBHOST_LOG;

    // Root hubs have no parent and nothing behind them we could talk to.
    if (libusb_get_parent(device) == nullptr) {
        return USB_ERROR_DEVICE_NOT_REAL;
    }

    libusb_device_descriptor desc;
    int ret = libusb_get_device_descriptor(device, &desc);
    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to get device descriptor" << endLog;
        return UsbErrorFromLibusb(ret);
    }

    UsbDeviceInformation information;
    information.vendorId = desc.idVendor;
    information.productId = desc.idProduct;
    information.backendNumericLocation = LibusbLocationFor(device);
    information.backendStringLocation = LibusbPortPathFor(device);

    ReadDeviceStrings(device, desc, information);

    log(USBHOST_LOG_LEVEL_DEBUG) << "Device " << *information.backendStringLocation << ": vid: 0x" << std::hex
        << std::setw(4) << std::setfill('0') << desc.idVendor << ", pid: 0x" << std::setw(4) << desc.idProduct
        << std::dec << endLog;

    return information;
}

void LibusbBackend::ReadDeviceStrings(libusb_device *device, const libusb_device_descriptor &desc,
    UsbDeviceInformation &information)
{
    USBHOST_LOG;

    if (desc.iManufacturer == 0 && desc.iProduct == 0 && desc.iSerialNumber == 0) {
        return;
    }

    // Strings are only available from devices we are allowed to open. The
    // device is reported either way.
    libusb_device_handle *rawHandle = nullptr;
    int ret = libusb_open(device, &rawHandle);
    if (ret < 0 || rawHandle == nullptr) {
        log(USBHOST_LOG_LEVEL_DEBUG) << "Can't open " << LibusbPortPathFor(device) << " for its strings: "
            << libusb_error_name(ret) << endLog;
        return;
    }
    LibusbDeviceHandlePtr handle(rawHandle);

    auto readString = [&handle](uint8_t index) -> std::optional<std::string> {
        if (index == 0) {
            return std::nullopt;
        }

        unsigned char buffer[256];
        int length = libusb_get_string_descriptor_ascii(handle.get(), index, buffer, sizeof(buffer));
        if (length < 0) {
            return std::nullopt;
        }
        return std::string(reinterpret_cast<char *>(buffer), static_cast<size_t>(length));
    };

    information.vendor = readString(desc.iManufacturer);
    information.product = readString(desc.iProduct);
    information.serial = readString(desc.iSerialNumber);
}

UsbResult<std::unique_ptr<UsbBackendDevice>> LibusbBackend::Open(const UsbDeviceInformation &information)
{
    UsbResult<std::unique_ptr<LibusbDevice>> device = LibusbDevice::Open(information, m_config);
    if (!device) {
        return device.GetError();
    }

    return std::unique_ptr<UsbBackendDevice>(device.TakeValue());
}
