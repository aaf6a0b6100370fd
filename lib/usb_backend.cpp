#include "usb_backend.hpp"
#include "usb_request.hpp"
#include "usb_host_config.hpp"
#include "libusb_backend.hpp"
#include "usbhost_log.hpp"

UsbReadBuffer CreateReadBuffer(size_t size)
{
    return std::make_shared<std::vector<uint8_t>>(size, 0);
}

UsbStatus UsbValidateControlLength(size_t length)
{
    if (length > USB_MAX_CONTROL_LENGTH) {
        return USB_ERROR_OVERRUN;
    }
    return {};
}

UsbResult<std::shared_ptr<UsbBackend>> CreateUsbBackend(const UsbHostConfig &config)
{
    USBHOST_LOG;

    if (config.backend == "libusb") {
        UsbResult<std::shared_ptr<LibusbBackend>> backend = LibusbBackend::Create(config);
        if (!backend) {
            return backend.GetError();
        }
        return std::shared_ptr<UsbBackend>(backend.TakeValue());
    }

    log(USBHOST_LOG_LEVEL_ERROR) << "Unknown USB backend: " << config.backend << endLog;
    return USB_ERROR_UNSUPPORTED;
}
