#include <iostream>
#include <iomanip>
#include <climits>

#include "libusb_device.hpp"
#include "libusb_utils.hpp"
#include "usb_request.hpp"
#include "usbhost_log.hpp"

LibusbDevice::LibusbDevice(LibusbContextPtr context, LibusbDevicePtr device, LibusbDeviceHandlePtr handle,
    const UsbHostConfig &config)
    : m_context{std::move(context)}, m_device{std::move(device)}, m_handle{std::move(handle)}, m_config{config}
{
    m_usbPath = LibusbPortPathFor(m_device.get());
}

LibusbDevice::~LibusbDevice()
{
    USBHOST_LOG;

    Close();

    log(USBHOST_LOG_LEVEL_DEBUG) << "Closed USB device " << m_usbPath << endLog;
}

UsbResult<std::unique_ptr<LibusbDevice>> LibusbDevice::Open(const UsbDeviceInformation &information,
    const UsbHostConfig &config)
{
    USBHOST_LOG;

    if (!information.backendNumericLocation) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Device information carries no libusb location" << endLog;
        return USB_ERROR_INVALID_ARGUMENT;
    }
    uint64_t targetLocation = *information.backendNumericLocation;

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

    LibusbDevicePtr device;
    {
        LibusbDeviceList deviceList;
        ssize_t count = deviceList.Load(context.get());
        if (count < 0) {
            log(USBHOST_LOG_LEVEL_ERROR) << "Failed to get device list: " << libusb_error_name(static_cast<int>(count)) << endLog;
            return UsbErrorFromLibusb(static_cast<int>(count));
        }

        for (size_t i = 0; i < deviceList.Size(); ++i) {
            if (LibusbLocationFor(deviceList[i]) == targetLocation) {
                device.reset(libusb_ref_device(deviceList[i]));
                break;
            }
        }
    }

    if (!device) {
        log(USBHOST_LOG_LEVEL_ERROR) << "No device at location 0x" << std::hex << targetLocation << std::dec << endLog;
        return USB_ERROR_DEVICE_NOT_FOUND;
    }

    // A device that was just plugged in can report "no resources" until the
    // OS has settled which driver binds to it, so give it a few more tries.
    libusb_device_handle *rawHandle = nullptr;
    ret = LibusbRetryNoResources([&device, &rawHandle]() {
        return libusb_open(device.get(), &rawHandle);
    }, config.openRetryCount, config.openRetryDelay);

    if (ret == LIBUSB_ERROR_NO_MEM) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Device kept reporting no resources; giving up" << endLog;
        return USB_ERROR_DEVICE_NOT_FOUND;
    }

    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to open USB device: " << libusb_error_name(ret) << endLog;
        return UsbErrorFromLibusb(ret);
    }

    if (rawHandle == nullptr) {
        log(USBHOST_LOG_LEVEL_ERROR) << "libusb_open succeeded without returning a handle" << endLog;
        return USB_ERROR_UNSPECIFIED_OS_ERROR;
    }
    LibusbDeviceHandlePtr handle(rawHandle);

    std::unique_ptr<LibusbDevice> backendDevice(new LibusbDevice(std::move(context), std::move(device),
        std::move(handle), config));

    UsbStatus status = backendDevice->PopulateInterfaces();
    if (!status) {
        return status.GetError();
    }

    backendDevice->StartEventLoop();

    log(USBHOST_LOG_LEVEL_INFO) << "Opened USB device " << backendDevice->m_usbPath << endLog;

    return std::move(backendDevice);
}

UsbStatus LibusbDevice::PopulateInterfaces()
{
    USBHOST_LOG;

    libusb_config_descriptor *rawConfig = nullptr;
    int ret = libusb_get_active_config_descriptor(m_device.get(), &rawConfig);
    if (ret == LIBUSB_ERROR_NOT_FOUND) {
        log(USBHOST_LOG_LEVEL_INFO) << "Device " << m_usbPath << " is unconfigured; no interfaces to track" << endLog;
        return {};
    }
    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to get config descriptor: " << libusb_error_name(ret) << endLog;
        return UsbErrorFromLibusb(ret);
    }
    if (rawConfig == nullptr) {
        return USB_ERROR_UNSPECIFIED_OS_ERROR;
    }
    LibusbConfigDescriptorPtr config(rawConfig);

    log(USBHOST_LOG_LEVEL_DEBUG) << "Configuration Descriptor:" << endLog;
    log(USBHOST_LOG_LEVEL_DEBUG) << "  wTotalLength: " << config->wTotalLength << endLog;
    log(USBHOST_LOG_LEVEL_DEBUG) << "  bNumInterfaces: " << static_cast<int>(config->bNumInterfaces) << endLog;
    log(USBHOST_LOG_LEVEL_DEBUG) << "  bConfigurationValue: " << static_cast<int>(config->bConfigurationValue) << endLog;
    log(USBHOST_LOG_LEVEL_DEBUG) << "  bmAttributes: " << static_cast<int>(config->bmAttributes) << endLog;
    log(USBHOST_LOG_LEVEL_DEBUG) << "  MaxPower: " << static_cast<int>(config->MaxPower) << endLog;

    std::lock_guard<std::mutex> lock(m_interfacesMutex);

    for (int i = 0; i < config->bNumInterfaces; ++i) {
        const libusb_interface &usbInterface = config->interface[i];
        if (usbInterface.num_altsetting < 1) {
            continue;
        }

        // Endpoints are taken from the default alternate setting.
        const libusb_interface_descriptor &altsetting = usbInterface.altsetting[0];
        uint8_t number = altsetting.bInterfaceNumber;

        log(USBHOST_LOG_LEVEL_DEBUG) << "Interface Descriptor:" << endLog;
        log(USBHOST_LOG_LEVEL_DEBUG) << "  bInterfaceNumber: " << static_cast<int>(number) << endLog;
        log(USBHOST_LOG_LEVEL_DEBUG) << "  bNumEndpoints: " << static_cast<int>(altsetting.bNumEndpoints) << endLog;
        log(USBHOST_LOG_LEVEL_DEBUG) << "  bInterfaceClass: " << static_cast<int>(altsetting.bInterfaceClass) << endLog;

        // Probe the interface with a short claim. One we are not allowed to
        // touch must not keep the other interfaces of the device from us.
        ret = libusb_claim_interface(m_handle.get(), number);
        if (ret == LIBUSB_SUCCESS) {
            libusb_release_interface(m_handle.get(), number);
            m_interfaces.emplace(number, LibusbInterface(m_handle.get(), number));
        } else if (ret == LIBUSB_ERROR_ACCESS) {
            log(USBHOST_LOG_LEVEL_DEBUG) << "Interface " << static_cast<int>(number)
                << " can't be opened; using a permission-denied placeholder" << endLog;
            m_interfaces.emplace(number, LibusbInterface::DenyingPlaceholder(number));
        } else if (ret == LIBUSB_ERROR_BUSY || ret == LIBUSB_ERROR_NOT_SUPPORTED || ret == LIBUSB_ERROR_NOT_FOUND) {
            log(USBHOST_LOG_LEVEL_DEBUG) << "Interface " << static_cast<int>(number) << " is held elsewhere: "
                << libusb_error_name(ret) << endLog;
            m_interfaces.emplace(number, LibusbInterface(m_handle.get(), number));
        } else {
            log(USBHOST_LOG_LEVEL_ERROR) << "Failed to probe interface " << static_cast<int>(number) << ": "
                << libusb_error_name(ret) << endLog;
            return UsbErrorFromLibusb(ret);
        }

        PopulateEndpointMetadata(altsetting);
    }

    return {};
}

void LibusbDevice::PopulateEndpointMetadata(const libusb_interface_descriptor &altsetting)
{
    USBHOST_LOG;

    for (int k = 0; k < altsetting.bNumEndpoints; ++k) {
        const libusb_endpoint_descriptor &endpoint = altsetting.endpoint[k];

        log(USBHOST_LOG_LEVEL_DEBUG) << "Endpoint Descriptor:" << endLog;
        log(USBHOST_LOG_LEVEL_DEBUG) << "  bEndpointAddress: 0x" << std::hex << static_cast<int>(endpoint.bEndpointAddress) << std::dec << endLog;
        log(USBHOST_LOG_LEVEL_DEBUG) << "  bmAttributes: " << static_cast<int>(endpoint.bmAttributes) << endLog;
        log(USBHOST_LOG_LEVEL_DEBUG) << "  wMaxPacketSize: " << endpoint.wMaxPacketSize << endLog;

        UsbEndpointInformation information;
        information.interfaceNumber = altsetting.bInterfaceNumber;
        information.pipeRef = static_cast<uint8_t>(k + 1);
        information.transferType = static_cast<UsbTransferType>(endpoint.bmAttributes & 0x03);
        information.maxPacketSize = endpoint.wMaxPacketSize;

        m_endpointMetadata[endpoint.bEndpointAddress] = information;
    }
}

void LibusbDevice::StartEventLoop()
{
    libusb_context *ctx = m_context.get();

    auto pump = [ctx](std::chrono::milliseconds slice) {
        USBHOST_LOG;

        struct timeval tv;
        tv.tv_sec = static_cast<long>(slice.count() / 1000);
        tv.tv_usec = static_cast<long>((slice.count() % 1000) * 1000);

        int ret = libusb_handle_events_timeout_completed(ctx, &tv, nullptr);
        if (ret < 0 && ret != LIBUSB_ERROR_INTERRUPTED) {
            log(USBHOST_LOG_LEVEL_ERROR) << "Failed to handle events: " << libusb_error_name(ret) << endLog;
            return false;
        }
        return true;
    };

    auto wake = [ctx]() {
        libusb_interrupt_event_handler(ctx);
    };

    m_eventLoop = std::make_unique<UsbEventLoop>("usb " + m_usbPath, m_config.eventLoopSlice, pump, wake);
    m_eventLoop->Start();
}

void LibusbDevice::Close()
{
    USBHOST_LOG;

    if (m_eventLoop && m_eventLoop->IsLoopThread()) {
        UsbHostFatal("USB device " + m_usbPath + " destroyed from its own completion callback");
    }

    std::unique_lock<std::mutex> lock(m_transfersMutex);
    m_closing = true;

    for (libusb_transfer *transfer : m_inFlight) {
        int ret = LibusbCancelTransferStatus(libusb_cancel_transfer(transfer));
        if (ret < 0) {
            log(USBHOST_LOG_LEVEL_WARNING) << "Failed to cancel transfer: " << libusb_error_name(ret) << endLog;
        }
    }

    // Cancelled transfers still report back through the trampoline; wait for
    // them before the context they belong to goes away.
    while (m_outstanding > 0) {
        if (m_eventLoop && m_eventLoop->IsRunning()) {
            m_transfersCV.wait_for(lock, m_config.eventLoopSlice);
        } else {
            lock.unlock();
            struct timeval tv;
            tv.tv_sec = 0;
            tv.tv_usec = 100000;
            libusb_handle_events_timeout_completed(m_context.get(), &tv, nullptr);
            lock.lock();
        }
    }
    lock.unlock();

    if (m_eventLoop) {
        m_eventLoop->Stop();
    }

    std::lock_guard<std::mutex> interfacesLock(m_interfacesMutex);
    m_interfaces.clear();
}

UsbStatus LibusbDevice::ReleaseKernelDriver(uint8_t interfaceNumber)
{
    std::lock_guard<std::mutex> lock(m_interfacesMutex);

    auto it = m_interfaces.find(interfaceNumber);
    if (it == m_interfaces.end()) {
        return USB_ERROR_INVALID_INTERFACE;
    }

    return it->second.ReleaseKernelDriver();
}

UsbStatus LibusbDevice::ClaimInterface(uint8_t interfaceNumber)
{
    std::lock_guard<std::mutex> lock(m_interfacesMutex);

    auto it = m_interfaces.find(interfaceNumber);
    if (it == m_interfaces.end()) {
        return USB_ERROR_INVALID_INTERFACE;
    }

    return it->second.Claim();
}

UsbStatus LibusbDevice::UnclaimInterface(uint8_t interfaceNumber)
{
    std::lock_guard<std::mutex> lock(m_interfacesMutex);

    auto it = m_interfaces.find(interfaceNumber);
    if (it == m_interfaces.end()) {
        return USB_ERROR_INVALID_INTERFACE;
    }

    return it->second.Unclaim();
}

bool LibusbDevice::IsInterfaceClaimed(uint8_t interfaceNumber) const
{
    std::lock_guard<std::mutex> lock(m_interfacesMutex);

    auto it = m_interfaces.find(interfaceNumber);
    return it != m_interfaces.end() && it->second.IsClaimed();
}

UsbResult<uint8_t> LibusbDevice::ActiveConfiguration()
{
    int configuration = 0;
    int ret = libusb_get_configuration(m_handle.get(), &configuration);
    if (ret < 0) {
        return UsbErrorFromLibusb(ret);
    }

    return static_cast<uint8_t>(configuration);
}

UsbStatus LibusbDevice::SetActiveConfiguration(uint8_t configuration)
{
    return UsbStatusFromLibusb(libusb_set_configuration(m_handle.get(), configuration));
}

UsbStatus LibusbDevice::ResetDevice()
{
    USBHOST_LOG;

    int ret = libusb_reset_device(m_handle.get());
    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to reset device " << m_usbPath << ": " << libusb_error_name(ret) << endLog;
    }

    return UsbStatusFromLibusb(ret);
}

UsbStatus LibusbDevice::ClearStall(uint8_t endpointAddress)
{
    USBHOST_LOG;

    int ret = libusb_clear_halt(m_handle.get(), endpointAddress);
    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to clear halt on endpoint: " << libusb_error_name(ret) << endLog;
    }

    return UsbStatusFromLibusb(ret);
}

UsbStatus LibusbDevice::SetAlternateSetting(uint8_t interfaceNumber, uint8_t setting)
{
    std::lock_guard<std::mutex> lock(m_interfacesMutex);

    auto it = m_interfaces.find(interfaceNumber);
    if (it == m_interfaces.end()) {
        return USB_ERROR_INVALID_INTERFACE;
    }

    return it->second.SetAlternateSetting(setting);
}

UsbResult<uint64_t> LibusbDevice::CurrentBusFrame()
{
    // libusb has no way to ask for the current frame number.
    return USB_ERROR_UNSUPPORTED;
}

UsbResult<size_t> LibusbDevice::ControlRead(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
    uint8_t *data, size_t length, UsbTimeout timeout)
{
    USBHOST_LOG;

    UsbStatus status = UsbValidateControlLength(length);
    if (!status) {
        return status.GetError();
    }

    if ((requestType & USB_ENDPOINT_DIRECTION_IN) == 0 || (data == nullptr && length > 0)) {
        return USB_ERROR_INVALID_ARGUMENT;
    }

    int ret = libusb_control_transfer(m_handle.get(), requestType, request, value, index, data,
        static_cast<uint16_t>(length), LibusbTimeoutFromUsbTimeout(timeout));
    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_DEBUG) << "Control read failed: " << libusb_error_name(ret) << endLog;
        return UsbErrorFromLibusb(ret);
    }

    return static_cast<size_t>(ret);
}

UsbResult<size_t> LibusbDevice::ControlWrite(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
    const uint8_t *data, size_t length, UsbTimeout timeout)
{
    USBHOST_LOG;

    UsbStatus status = UsbValidateControlLength(length);
    if (!status) {
        return status.GetError();
    }

    if ((requestType & USB_ENDPOINT_DIRECTION_IN) != 0 || (data == nullptr && length > 0)) {
        return USB_ERROR_INVALID_ARGUMENT;
    }

    int ret = libusb_control_transfer(m_handle.get(), requestType, request, value, index,
        const_cast<uint8_t *>(data), static_cast<uint16_t>(length), LibusbTimeoutFromUsbTimeout(timeout));
    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_DEBUG) << "Control write failed: " << libusb_error_name(ret) << endLog;
        return UsbErrorFromLibusb(ret);
    }

    return static_cast<size_t>(ret);
}

UsbStatus LibusbDevice::ControlReadNonblocking(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
    UsbReadBuffer buffer, UsbTransferCallback callback, UsbTimeout timeout)
{
    if (!buffer || (requestType & USB_ENDPOINT_DIRECTION_IN) == 0) {
        return USB_ERROR_INVALID_ARGUMENT;
    }

    UsbStatus status = UsbValidateControlLength(buffer->size());
    if (!status) {
        return status;
    }

    UsbResult<std::unique_ptr<UsbPendingTransfer>> allocated = AllocatePendingTransfer(std::move(callback));
    if (!allocated) {
        return allocated.GetError();
    }
    std::unique_ptr<UsbPendingTransfer> pending = allocated.TakeValue();

    pending->buffer.assign(LIBUSB_CONTROL_SETUP_SIZE + buffer->size(), 0);
    libusb_fill_control_setup(pending->buffer.data(), requestType, request, value, index,
        static_cast<uint16_t>(buffer->size()));
    libusb_fill_control_transfer(pending->transfer.get(), m_handle.get(), pending->buffer.data(),
        UsbTransferTrampoline, nullptr, LibusbTimeoutFromUsbTimeout(timeout));
    pending->readBuffer = std::move(buffer);
    pending->isControl = true;

    return Submit(std::move(pending));
}

UsbStatus LibusbDevice::ControlWriteNonblocking(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
    std::vector<uint8_t> data, UsbTransferCallback callback, UsbTimeout timeout)
{
    if ((requestType & USB_ENDPOINT_DIRECTION_IN) != 0) {
        return USB_ERROR_INVALID_ARGUMENT;
    }

    UsbStatus status = UsbValidateControlLength(data.size());
    if (!status) {
        return status;
    }

    UsbResult<std::unique_ptr<UsbPendingTransfer>> allocated = AllocatePendingTransfer(std::move(callback));
    if (!allocated) {
        return allocated.GetError();
    }
    std::unique_ptr<UsbPendingTransfer> pending = allocated.TakeValue();

    pending->buffer.assign(LIBUSB_CONTROL_SETUP_SIZE, 0);
    pending->buffer.insert(pending->buffer.end(), data.begin(), data.end());
    libusb_fill_control_setup(pending->buffer.data(), requestType, request, value, index,
        static_cast<uint16_t>(data.size()));
    libusb_fill_control_transfer(pending->transfer.get(), m_handle.get(), pending->buffer.data(),
        UsbTransferTrampoline, nullptr, LibusbTimeoutFromUsbTimeout(timeout));
    pending->isControl = true;

    return Submit(std::move(pending));
}

UsbResult<UsbEndpointInformation> LibusbDevice::ResolveEndpoint(uint8_t endpointAddress) const
{
    std::lock_guard<std::mutex> lock(m_interfacesMutex);
    return LibusbResolveEndpoint(endpointAddress, m_endpointMetadata, m_interfaces);
}

UsbResult<size_t> LibusbDevice::TransferSync(uint8_t endpointAddress, uint8_t *data, size_t length, UsbTimeout timeout)
{
    USBHOST_LOG;

    UsbResult<UsbEndpointInformation> endpoint = ResolveEndpoint(endpointAddress);
    if (!endpoint) {
        return endpoint.GetError();
    }

    if (length > INT_MAX || (data == nullptr && length > 0)) {
        return USB_ERROR_INVALID_ARGUMENT;
    }

    int transferred = 0;
    int ret;
    if (endpoint.GetValue().transferType == USB_TRANSFER_TYPE_INTERRUPT) {
        ret = libusb_interrupt_transfer(m_handle.get(), endpointAddress, data, static_cast<int>(length),
            &transferred, LibusbTimeoutFromUsbTimeout(timeout));
    } else {
        ret = libusb_bulk_transfer(m_handle.get(), endpointAddress, data, static_cast<int>(length),
            &transferred, LibusbTimeoutFromUsbTimeout(timeout));
    }

    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Transfer on endpoint 0x" << std::hex << static_cast<int>(endpointAddress)
            << std::dec << " failed: " << libusb_error_name(ret) << endLog;
        return UsbErrorFromLibusb(ret);
    }

    return static_cast<size_t>(transferred);
}

UsbResult<size_t> LibusbDevice::Read(uint8_t endpointAddress, uint8_t *data, size_t length, UsbTimeout timeout)
{
    USBHOST_LOG;

    if (!UsbEndpointAddressIsIn(endpointAddress)) {
        return USB_ERROR_INVALID_ENDPOINT;
    }

    log(USBHOST_LOG_LEVEL_DEBUG) << "Reading " << length << " bytes from endpoint 0x" << std::hex
        << static_cast<int>(endpointAddress) << std::dec << endLog;

    return TransferSync(endpointAddress, data, length, timeout);
}

UsbResult<size_t> LibusbDevice::Write(uint8_t endpointAddress, const uint8_t *data, size_t length, UsbTimeout timeout)
{
    USBHOST_LOG;

    if (UsbEndpointAddressIsIn(endpointAddress)) {
        return USB_ERROR_INVALID_ENDPOINT;
    }

    log(USBHOST_LOG_LEVEL_DEBUG) << "Writing to endpoint 0x" << std::hex << static_cast<int>(endpointAddress) << std::dec << endLog;
    log(USBHOST_LOG_LEVEL_DEBUG) << "  Length: " << length << endLog;
    log(USBHOST_LOG_LEVEL_DEBUG) << "  Data: ";
    for (size_t i = 0; i < 16 && i < length; ++i) {
        log << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]) << " ";
    }
    log << std::dec << endLog;

    return TransferSync(endpointAddress, const_cast<uint8_t *>(data), length, timeout);
}

UsbStatus LibusbDevice::ReadNonblocking(uint8_t endpointAddress, UsbReadBuffer buffer,
    UsbTransferCallback callback, UsbTimeout timeout)
{
    if (!UsbEndpointAddressIsIn(endpointAddress)) {
        return USB_ERROR_INVALID_ENDPOINT;
    }

    if (!buffer || buffer->size() > INT_MAX) {
        return USB_ERROR_INVALID_ARGUMENT;
    }

    UsbResult<UsbEndpointInformation> endpoint = ResolveEndpoint(endpointAddress);
    if (!endpoint) {
        return endpoint.GetError();
    }

    UsbResult<std::unique_ptr<UsbPendingTransfer>> allocated = AllocatePendingTransfer(std::move(callback));
    if (!allocated) {
        return allocated.GetError();
    }
    std::unique_ptr<UsbPendingTransfer> pending = allocated.TakeValue();

    pending->buffer.assign(buffer->size(), 0);
    if (endpoint.GetValue().transferType == USB_TRANSFER_TYPE_INTERRUPT) {
        libusb_fill_interrupt_transfer(pending->transfer.get(), m_handle.get(), endpointAddress,
            pending->buffer.data(), static_cast<int>(pending->buffer.size()), UsbTransferTrampoline, nullptr,
            LibusbTimeoutFromUsbTimeout(timeout));
    } else {
        libusb_fill_bulk_transfer(pending->transfer.get(), m_handle.get(), endpointAddress,
            pending->buffer.data(), static_cast<int>(pending->buffer.size()), UsbTransferTrampoline, nullptr,
            LibusbTimeoutFromUsbTimeout(timeout));
    }
    pending->readBuffer = std::move(buffer);

    return Submit(std::move(pending));
}

UsbStatus LibusbDevice::WriteNonblocking(uint8_t endpointAddress, std::vector<uint8_t> data,
    UsbTransferCallback callback, UsbTimeout timeout)
{
    if (UsbEndpointAddressIsIn(endpointAddress)) {
        return USB_ERROR_INVALID_ENDPOINT;
    }

    if (data.size() > INT_MAX) {
        return USB_ERROR_INVALID_ARGUMENT;
    }

    UsbResult<UsbEndpointInformation> endpoint = ResolveEndpoint(endpointAddress);
    if (!endpoint) {
        return endpoint.GetError();
    }

    UsbResult<std::unique_ptr<UsbPendingTransfer>> allocated = AllocatePendingTransfer(std::move(callback));
    if (!allocated) {
        return allocated.GetError();
    }
    std::unique_ptr<UsbPendingTransfer> pending = allocated.TakeValue();

    pending->buffer = std::move(data);
    if (endpoint.GetValue().transferType == USB_TRANSFER_TYPE_INTERRUPT) {
        libusb_fill_interrupt_transfer(pending->transfer.get(), m_handle.get(), endpointAddress,
            pending->buffer.data(), static_cast<int>(pending->buffer.size()), UsbTransferTrampoline, nullptr,
            LibusbTimeoutFromUsbTimeout(timeout));
    } else {
        libusb_fill_bulk_transfer(pending->transfer.get(), m_handle.get(), endpointAddress,
            pending->buffer.data(), static_cast<int>(pending->buffer.size()), UsbTransferTrampoline, nullptr,
            LibusbTimeoutFromUsbTimeout(timeout));
    }

    return Submit(std::move(pending));
}

UsbStatus LibusbDevice::Abort()
{
    USBHOST_LOG;

    std::lock_guard<std::mutex> lock(m_transfersMutex);

    log(USBHOST_LOG_LEVEL_DEBUG) << "Aborting " << m_inFlight.size() << " transfers on " << m_usbPath << endLog;

    // A transfer that already completed or whose device went away is
    // cancelled as far as its caller is concerned.
    int firstError = LIBUSB_SUCCESS;
    for (libusb_transfer *transfer : m_inFlight) {
        int ret = LibusbCancelTransferStatus(libusb_cancel_transfer(transfer));
        if (ret < 0) {
            log(USBHOST_LOG_LEVEL_ERROR) << "Failed to cancel transfer: " << libusb_error_name(ret) << endLog;
            if (firstError == LIBUSB_SUCCESS) {
                firstError = ret;
            }
        }
    }

    return UsbStatusFromLibusb(firstError);
}

UsbResult<std::unique_ptr<UsbPendingTransfer>> LibusbDevice::AllocatePendingTransfer(UsbTransferCallback callback)
{
    if (!callback) {
        return USB_ERROR_INVALID_ARGUMENT;
    }

    std::unique_ptr<UsbPendingTransfer> pending = std::make_unique<UsbPendingTransfer>();
    pending->transfer.reset(libusb_alloc_transfer(0));
    if (!pending->transfer) {
        return UsbErrorFromLibusb(LIBUSB_ERROR_NO_MEM);
    }

    pending->callback = std::move(callback);
    pending->tracker = this;
    pending->completionLoop = m_eventLoop.get();

    return std::move(pending);
}

UsbStatus LibusbDevice::Submit(std::unique_ptr<UsbPendingTransfer> pending)
{
    USBHOST_LOG;

    libusb_transfer *transfer = pending->transfer.get();

    // Holding the lock across submission keeps the trampoline from retiring
    // the transfer before it has been recorded as in flight.
    std::lock_guard<std::mutex> lock(m_transfersMutex);
    if (m_closing) {
        return USB_ERROR_DEVICE_NOT_OPEN;
    }

    int ret = SubmitPendingTransfer(std::move(pending));
    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to submit transfer: " << libusb_error_name(ret) << endLog;
        return UsbErrorFromLibusb(ret);
    }

    m_inFlight.insert(transfer);
    ++m_outstanding;

    return {};
}

void LibusbDevice::TransferRetired(libusb_transfer *transfer)
{
    std::lock_guard<std::mutex> lock(m_transfersMutex);
    m_inFlight.erase(transfer);
}

void LibusbDevice::TransferFinished()
{
    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        --m_outstanding;
    }
    m_transfersCV.notify_all();
}
