#include <iostream>

#include "usb_device.hpp"
#include "usb_endpoint.hpp"
#include "usbhost_log.hpp"

UsbDevice::UsbDevice(std::unique_ptr<UsbBackendDevice> backendDevice, std::shared_ptr<UsbBackend> backend,
    const UsbDeviceInformation &information)
    : m_information{information}, m_backend{std::move(backend)}, m_backendDevice{std::move(backendDevice)}
{
    if (!m_backendDevice || !m_backend) {
        UsbHostFatal("UsbDevice created without a backend device");
    }
}

UsbDevice::~UsbDevice()
{
    USBHOST_LOG;

    log(USBHOST_LOG_LEVEL_DEBUG) << "Closing " << m_information << endLog;

    // The backend device goes first; it may still need the backend.
    m_backendDevice.reset();
}

const char *UsbDevice::GetBackendName() const
{
    return m_backend->GetName();
}

UsbStatus UsbDevice::ReleaseKernelDriver(uint8_t interfaceNumber)
{
    return m_backendDevice->ReleaseKernelDriver(interfaceNumber);
}

UsbStatus UsbDevice::ClaimInterface(uint8_t interfaceNumber)
{
    USBHOST_LOG;

    UsbStatus status = m_backendDevice->ClaimInterface(interfaceNumber);
    if (!status) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to claim interface " << static_cast<int>(interfaceNumber) << ": "
            << status.GetError().GetMessage() << endLog;
    }

    return status;
}

UsbStatus UsbDevice::UnclaimInterface(uint8_t interfaceNumber)
{
    return m_backendDevice->UnclaimInterface(interfaceNumber);
}

bool UsbDevice::IsInterfaceClaimed(uint8_t interfaceNumber) const
{
    return m_backendDevice->IsInterfaceClaimed(interfaceNumber);
}

UsbResult<uint8_t> UsbDevice::ActiveConfiguration()
{
    return m_backendDevice->ActiveConfiguration();
}

UsbStatus UsbDevice::SetActiveConfiguration(uint8_t configuration)
{
    return m_backendDevice->SetActiveConfiguration(configuration);
}

UsbStatus UsbDevice::ResetDevice()
{
    return m_backendDevice->ResetDevice();
}

UsbStatus UsbDevice::ClearStall(uint8_t endpointAddress)
{
    return m_backendDevice->ClearStall(endpointAddress);
}

UsbStatus UsbDevice::SetAlternateSetting(uint8_t interfaceNumber, uint8_t setting)
{
    return m_backendDevice->SetAlternateSetting(interfaceNumber, setting);
}

UsbResult<uint64_t> UsbDevice::CurrentBusFrame()
{
    return m_backendDevice->CurrentBusFrame();
}

UsbResult<size_t> UsbDevice::ControlRead(UsbRequestType requestType, uint8_t request, uint16_t value,
    uint16_t index, uint8_t *data, size_t length, UsbTimeout timeout)
{
    UsbStatus status = UsbValidateControlLength(length);
    if (!status) {
        return status.GetError();
    }

    return m_backendDevice->ControlRead(UsbRequestTypeByte(requestType), request, value, index, data, length,
        timeout);
}

UsbResult<size_t> UsbDevice::ControlWrite(UsbRequestType requestType, uint8_t request, uint16_t value,
    uint16_t index, const uint8_t *data, size_t length, UsbTimeout timeout)
{
    UsbStatus status = UsbValidateControlLength(length);
    if (!status) {
        return status.GetError();
    }

    return m_backendDevice->ControlWrite(UsbRequestTypeByte(requestType), request, value, index, data, length,
        timeout);
}

UsbStatus UsbDevice::ControlReadAsync(UsbRequestType requestType, uint8_t request, uint16_t value, uint16_t index,
    UsbReadBuffer buffer, UsbTransferCallback callback, UsbTimeout timeout)
{
    if (!buffer) {
        return USB_ERROR_INVALID_ARGUMENT;
    }

    UsbStatus status = UsbValidateControlLength(buffer->size());
    if (!status) {
        return status;
    }

    return m_backendDevice->ControlReadNonblocking(UsbRequestTypeByte(requestType), request, value, index,
        std::move(buffer), std::move(callback), timeout);
}

UsbResult<UsbTransferFuture> UsbDevice::ControlReadAsync(UsbRequestType requestType, uint8_t request,
    uint16_t value, uint16_t index, UsbReadBuffer buffer, UsbTimeout timeout)
{
    UsbTransferFuture future;

    UsbStatus status = ControlReadAsync(requestType, request, value, index, std::move(buffer),
        future.MakeCallback(), timeout);
    if (!status) {
        return status.GetError();
    }

    return std::move(future);
}

UsbStatus UsbDevice::ControlWriteAsync(UsbRequestType requestType, uint8_t request, uint16_t value,
    uint16_t index, std::vector<uint8_t> data, UsbTransferCallback callback, UsbTimeout timeout)
{
    UsbStatus status = UsbValidateControlLength(data.size());
    if (!status) {
        return status;
    }

    return m_backendDevice->ControlWriteNonblocking(UsbRequestTypeByte(requestType), request, value, index,
        std::move(data), std::move(callback), timeout);
}

UsbResult<UsbTransferFuture> UsbDevice::ControlWriteAsync(UsbRequestType requestType, uint8_t request,
    uint16_t value, uint16_t index, std::vector<uint8_t> data, UsbTimeout timeout)
{
    UsbTransferFuture future;

    UsbStatus status = ControlWriteAsync(requestType, request, value, index, std::move(data),
        future.MakeCallback(), timeout);
    if (!status) {
        return status.GetError();
    }

    return std::move(future);
}

UsbResult<size_t> UsbDevice::Read(uint8_t endpoint, uint8_t *data, size_t length, UsbTimeout timeout)
{
    return m_backendDevice->Read(UsbAddressForInEndpoint(endpoint), data, length, timeout);
}

UsbResult<size_t> UsbDevice::Write(uint8_t endpoint, const uint8_t *data, size_t length, UsbTimeout timeout)
{
    return m_backendDevice->Write(UsbAddressForOutEndpoint(endpoint), data, length, timeout);
}

UsbStatus UsbDevice::ReadAsync(uint8_t endpoint, UsbReadBuffer buffer, UsbTransferCallback callback,
    UsbTimeout timeout)
{
    if (!buffer) {
        return USB_ERROR_INVALID_ARGUMENT;
    }

    return m_backendDevice->ReadNonblocking(UsbAddressForInEndpoint(endpoint), std::move(buffer),
        std::move(callback), timeout);
}

UsbResult<UsbTransferFuture> UsbDevice::ReadAsync(uint8_t endpoint, UsbReadBuffer buffer, UsbTimeout timeout)
{
    UsbTransferFuture future;

    UsbStatus status = ReadAsync(endpoint, std::move(buffer), future.MakeCallback(), timeout);
    if (!status) {
        return status.GetError();
    }

    return std::move(future);
}

UsbStatus UsbDevice::WriteAsync(uint8_t endpoint, std::vector<uint8_t> data, UsbTransferCallback callback,
    UsbTimeout timeout)
{
    return m_backendDevice->WriteNonblocking(UsbAddressForOutEndpoint(endpoint), std::move(data),
        std::move(callback), timeout);
}

UsbResult<UsbTransferFuture> UsbDevice::WriteAsync(uint8_t endpoint, std::vector<uint8_t> data,
    UsbTimeout timeout)
{
    UsbTransferFuture future;

    UsbStatus status = WriteAsync(endpoint, std::move(data), future.MakeCallback(), timeout);
    if (!status) {
        return status.GetError();
    }

    return std::move(future);
}

UsbResult<std::vector<uint8_t>> UsbDevice::ReadStandardDescriptor(UsbDescriptorType type, uint8_t index,
    size_t length, UsbTimeout timeout)
{
    USBHOST_LOG;

    std::vector<uint8_t> descriptor(length, 0);
    uint16_t value = static_cast<uint16_t>((type << 8) | index);

    UsbResult<size_t> transferred = ControlRead(USB_STANDARD_IN_FROM_DEVICE, USB_REQUEST_GET_DESCRIPTOR, value, 0,
        descriptor.data(), descriptor.size(), timeout);
    if (!transferred) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to read descriptor " << static_cast<int>(type) << ": "
            << transferred.GetError().GetMessage() << endLog;
        return transferred.GetError();
    }

    descriptor.resize(transferred.GetValue());

    return std::move(descriptor);
}

UsbResult<UsbTransferFuture> UsbDevice::ReadStandardDescriptorAsync(UsbDescriptorType type, uint8_t index,
    UsbReadBuffer buffer, UsbTimeout timeout)
{
    uint16_t value = static_cast<uint16_t>((type << 8) | index);

    return ControlReadAsync(USB_STANDARD_IN_FROM_DEVICE, USB_REQUEST_GET_DESCRIPTOR, value, 0, std::move(buffer),
        timeout);
}

UsbStatus UsbDevice::Abort()
{
    return m_backendDevice->Abort();
}
