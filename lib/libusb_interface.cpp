#include "libusb_interface.hpp"
#include "libusb_utils.hpp"
#include "usbhost_log.hpp"

LibusbInterface::LibusbInterface(libusb_device_handle *handle, uint8_t number)
    : m_handle{handle}, m_number{number}, m_claimed{false}
{}

LibusbInterface::LibusbInterface(LibusbInterface &&other)
    : m_handle{other.m_handle}, m_number{other.m_number}, m_claimed{other.m_claimed}
{
    other.m_claimed = false;
}

LibusbInterface::~LibusbInterface()
{
    USBHOST_LOG;

    if (m_claimed) {
        UsbStatus status = Unclaim();
        if (!status) {
            log(USBHOST_LOG_LEVEL_WARNING) << "Failed to release interface " << static_cast<int>(m_number)
                << ": " << status.GetError().GetMessage() << endLog;
        }
    }
}

LibusbInterface LibusbInterface::DenyingPlaceholder(uint8_t number)
{
    return LibusbInterface(nullptr, number);
}

UsbStatus LibusbInterface::Claim()
{
    USBHOST_LOG;

    if (IsPlaceholder()) {
        return USB_ERROR_PERMISSION_DENIED;
    }

    if (m_claimed) {
        return {};
    }

    int ret = libusb_claim_interface(m_handle, m_number);
    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to claim interface " << static_cast<int>(m_number)
            << ": " << libusb_error_name(ret) << endLog;
        return UsbErrorFromLibusb(ret);
    }

    m_claimed = true;
    log(USBHOST_LOG_LEVEL_DEBUG) << "Claimed interface " << static_cast<int>(m_number) << endLog;

    return {};
}

UsbStatus LibusbInterface::Unclaim()
{
    USBHOST_LOG;

    if (IsPlaceholder()) {
        return USB_ERROR_PERMISSION_DENIED;
    }

    if (!m_claimed) {
        return {};
    }

    // The claim is gone from our side either way.
    m_claimed = false;

    int ret = libusb_release_interface(m_handle, m_number);
    if (ret < 0 && ret != LIBUSB_ERROR_NO_DEVICE) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to release interface " << static_cast<int>(m_number)
            << ": " << libusb_error_name(ret) << endLog;
        return UsbErrorFromLibusb(ret);
    }

    log(USBHOST_LOG_LEVEL_DEBUG) << "Released interface " << static_cast<int>(m_number) << endLog;

    return {};
}

UsbStatus LibusbInterface::SetAlternateSetting(uint8_t setting)
{
    USBHOST_LOG;

    if (IsPlaceholder()) {
        return USB_ERROR_PERMISSION_DENIED;
    }

    if (!m_claimed) {
        return USB_ERROR_INVALID_INTERFACE;
    }

    int ret = libusb_set_interface_alt_setting(m_handle, m_number, setting);
    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to select alternate setting " << static_cast<int>(setting)
            << " on interface " << static_cast<int>(m_number) << ": " << libusb_error_name(ret) << endLog;
        return UsbErrorFromLibusb(ret);
    }

    return {};
}

UsbStatus LibusbInterface::ReleaseKernelDriver()
{
    USBHOST_LOG;

    if (IsPlaceholder()) {
        return USB_ERROR_PERMISSION_DENIED;
    }

    if (!libusb_has_capability(LIBUSB_CAP_SUPPORTS_DETACH_KERNEL_DRIVER)) {
        return USB_ERROR_UNSUPPORTED;
    }

    int ret = libusb_detach_kernel_driver(m_handle, m_number);
    if (ret == LIBUSB_ERROR_NOT_FOUND) {
        // No driver was bound, so there is nothing left holding the interface.
        log(USBHOST_LOG_LEVEL_DEBUG) << "No kernel driver bound to interface " << static_cast<int>(m_number) << endLog;
        return {};
    }

    if (ret < 0) {
        log(USBHOST_LOG_LEVEL_ERROR) << "Failed to detach kernel driver: " << libusb_error_name(ret) << endLog;
        return UsbErrorFromLibusb(ret);
    }

    log(USBHOST_LOG_LEVEL_INFO) << "Detached kernel driver from interface " << static_cast<int>(m_number) << endLog;

    return {};
}

UsbResult<UsbEndpointInformation> LibusbResolveEndpoint(uint8_t endpointAddress,
    const std::map<uint8_t, UsbEndpointInformation> &endpoints,
    const std::map<uint8_t, LibusbInterface> &interfaces)
{
    auto endpoint = endpoints.find(endpointAddress);
    if (endpoint == endpoints.end()) {
        return USB_ERROR_INVALID_ENDPOINT;
    }

    switch (endpoint->second.transferType) {
        case USB_TRANSFER_TYPE_BULK:
        case USB_TRANSFER_TYPE_INTERRUPT:
            break;
        case USB_TRANSFER_TYPE_ISOCHRONOUS:
            return USB_ERROR_UNSUPPORTED;
        case USB_TRANSFER_TYPE_CONTROL:
        default:
            return USB_ERROR_INVALID_ENDPOINT;
    }

    auto it = interfaces.find(endpoint->second.interfaceNumber);
    if (it == interfaces.end()) {
        UsbHostFatal("endpoint metadata refers to an interface the device does not track");
    }
    if (it->second.IsPlaceholder()) {
        return USB_ERROR_PERMISSION_DENIED;
    }
    if (!it->second.IsClaimed()) {
        return USB_ERROR_INVALID_INTERFACE;
    }

    return endpoint->second;
}
