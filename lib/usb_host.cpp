#include <iostream>

#include "usb_host.hpp"
#include "usbhost_log.hpp"

class UsbHost::UsbHostImpl {
public:
    UsbHostImpl(std::shared_ptr<UsbBackend> backend) : m_backend{std::move(backend)}
    {
        if (!m_backend) {
            UsbHostFatal("UsbHost created without a backend");
        }
    }

    ~UsbHostImpl()
    {}

    const char *GetBackendName() const
    {
        return m_backend->GetName();
    }

    UsbResult<std::vector<UsbDeviceInformation>> EnumerateDevices(const UsbDeviceSelector &selector,
        bool singleDevice)
    {
        USBHOST_LOG;

        UsbResult<std::vector<UsbDeviceInformation>> allDevices = m_backend->GetDevices();
        if (!allDevices) {
            log(USBHOST_LOG_LEVEL_ERROR) << "Failed to enumerate devices: "
                << allDevices.GetError().GetMessage() << endLog;
            return allDevices.GetError();
        }

        std::vector<UsbDeviceInformation> matchingDevices;
        for (const UsbDeviceInformation &device : allDevices.GetValue()) {
            if (selector.Matches(device)) {
                matchingDevices.push_back(device);

                if (singleDevice) {
                    break;
                }
            }
        }

        log(USBHOST_LOG_LEVEL_DEBUG) << matchingDevices.size() << " of " << allDevices.GetValue().size()
            << " devices match" << endLog;

        return std::move(matchingDevices);
    }

    UsbResult<std::unique_ptr<UsbDevice>> Open(const UsbDeviceInformation &information)
    {
        USBHOST_LOG;

        log(USBHOST_LOG_LEVEL_INFO) << "Opening " << information << endLog;

        UsbResult<std::unique_ptr<UsbBackendDevice>> backendDevice = m_backend->Open(information);
        if (!backendDevice) {
            log(USBHOST_LOG_LEVEL_ERROR) << "Failed to open " << information << ": "
                << backendDevice.GetError().GetMessage() << endLog;
            return backendDevice.GetError();
        }

        return std::make_unique<UsbDevice>(backendDevice.TakeValue(), m_backend, information);
    }

private:
    std::shared_ptr<UsbBackend> m_backend;
};

UsbHost::UsbHost(std::shared_ptr<UsbBackend> backend)
    : pImpl{std::make_unique<UsbHostImpl>(std::move(backend))}
{}

UsbHost::~UsbHost()
{}

UsbResult<std::unique_ptr<UsbHost>> UsbHost::Create(const UsbHostConfig &config)
{
    UsbResult<std::shared_ptr<UsbBackend>> backend = CreateUsbBackend(config);
    if (!backend) {
        return backend.GetError();
    }

    return std::make_unique<UsbHost>(backend.TakeValue());
}

const char *UsbHost::GetBackendName() const
{
    return pImpl->GetBackendName();
}

UsbResult<UsbDeviceInformation> UsbHost::Device(const UsbDeviceSelector &selector)
{
    UsbResult<std::vector<UsbDeviceInformation>> candidates = pImpl->EnumerateDevices(selector, true);
    if (!candidates) {
        return candidates.GetError();
    }

    if (candidates.GetValue().empty()) {
        return USB_ERROR_DEVICE_NOT_FOUND;
    }

    return candidates.GetValue().front();
}

UsbResult<std::vector<UsbDeviceInformation>> UsbHost::Devices(const UsbDeviceSelector &selector)
{
    return pImpl->EnumerateDevices(selector, false);
}

UsbResult<std::vector<UsbDeviceInformation>> UsbHost::AllDevices()
{
    return Devices(UsbDeviceSelector());
}

UsbResult<std::unique_ptr<UsbDevice>> UsbHost::Open(const UsbDeviceInformation &information)
{
    return pImpl->Open(information);
}

UsbResult<UsbDeviceInformation> UsbFindDevice(const UsbDeviceSelector &selector)
{
    UsbResult<std::unique_ptr<UsbHost>> host = UsbHost::Create();
    if (!host) {
        return host.GetError();
    }

    return host.GetValue()->Device(selector);
}

UsbResult<std::vector<UsbDeviceInformation>> UsbFindDevices(const UsbDeviceSelector &selector)
{
    UsbResult<std::unique_ptr<UsbHost>> host = UsbHost::Create();
    if (!host) {
        return host.GetError();
    }

    return host.GetValue()->Devices(selector);
}

UsbResult<std::vector<UsbDeviceInformation>> UsbAllDevices()
{
    return UsbFindDevices(UsbDeviceSelector());
}

UsbResult<std::unique_ptr<UsbDevice>> UsbOpen(const UsbDeviceInformation &information)
{
    UsbResult<std::unique_ptr<UsbHost>> host = UsbHost::Create();
    if (!host) {
        return host.GetError();
    }

    return host.GetValue()->Open(information);
}
