#pragma once

#include <cstdint>
#include <cstddef>
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <libusb-1.0/libusb.h>

#include "usb_backend.hpp"
#include "usb_endpoint.hpp"
#include "usb_event_loop.hpp"
#include "usb_host_config.hpp"
#include "usb_transfer_bridge.hpp"
#include "libusb_handles.hpp"
#include "libusb_interface.hpp"

// An opened device on the libusb backend.
//
// Every opened device gets its own libusb context, so its event loop only
// pumps notifications that belong to this device and its interfaces.
class LibusbDevice : public UsbBackendDevice, private UsbTransferTracker {
public:
    ~LibusbDevice() override;

    static UsbResult<std::unique_ptr<LibusbDevice>> Open(const UsbDeviceInformation &information,
        const UsbHostConfig &config);

    UsbStatus ReleaseKernelDriver(uint8_t interfaceNumber) override;

    UsbStatus ClaimInterface(uint8_t interfaceNumber) override;
    UsbStatus UnclaimInterface(uint8_t interfaceNumber) override;
    bool IsInterfaceClaimed(uint8_t interfaceNumber) const override;

    UsbResult<uint8_t> ActiveConfiguration() override;
    UsbStatus SetActiveConfiguration(uint8_t configuration) override;
    UsbStatus ResetDevice() override;
    UsbStatus ClearStall(uint8_t endpointAddress) override;
    UsbStatus SetAlternateSetting(uint8_t interfaceNumber, uint8_t setting) override;
    UsbResult<uint64_t> CurrentBusFrame() override;

    UsbResult<size_t> ControlRead(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
        uint8_t *data, size_t length, UsbTimeout timeout) override;
    UsbResult<size_t> ControlWrite(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
        const uint8_t *data, size_t length, UsbTimeout timeout) override;

    UsbStatus ControlReadNonblocking(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
        UsbReadBuffer buffer, UsbTransferCallback callback, UsbTimeout timeout) override;
    UsbStatus ControlWriteNonblocking(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
        std::vector<uint8_t> data, UsbTransferCallback callback, UsbTimeout timeout) override;

    UsbResult<size_t> Read(uint8_t endpointAddress, uint8_t *data, size_t length, UsbTimeout timeout) override;
    UsbResult<size_t> Write(uint8_t endpointAddress, const uint8_t *data, size_t length, UsbTimeout timeout) override;

    UsbStatus ReadNonblocking(uint8_t endpointAddress, UsbReadBuffer buffer,
        UsbTransferCallback callback, UsbTimeout timeout) override;
    UsbStatus WriteNonblocking(uint8_t endpointAddress, std::vector<uint8_t> data,
        UsbTransferCallback callback, UsbTimeout timeout) override;

    UsbStatus Abort() override;

private:
    LibusbDevice(LibusbContextPtr context, LibusbDevicePtr device, LibusbDeviceHandlePtr handle,
        const UsbHostConfig &config);

    // Declared in release order: the context goes last.
    LibusbContextPtr m_context;
    LibusbDevicePtr m_device;
    LibusbDeviceHandlePtr m_handle;
    UsbHostConfig m_config;
    std::string m_usbPath;

    mutable std::mutex m_interfacesMutex;
    std::map<uint8_t, LibusbInterface> m_interfaces;

    // Built once at open time and never changed afterwards.
    std::map<uint8_t, UsbEndpointInformation> m_endpointMetadata;

    std::unique_ptr<UsbEventLoop> m_eventLoop;

    std::mutex m_transfersMutex;
    std::condition_variable m_transfersCV;
    std::set<libusb_transfer *> m_inFlight;
    size_t m_outstanding = 0;
    bool m_closing = false;

    UsbStatus PopulateInterfaces();
    void PopulateEndpointMetadata(const libusb_interface_descriptor &altsetting);
    void StartEventLoop();
    void Close();

    // Resolves an endpoint address to its metadata and checks that its
    // interface is claimed.
    UsbResult<UsbEndpointInformation> ResolveEndpoint(uint8_t endpointAddress) const;

    UsbResult<size_t> TransferSync(uint8_t endpointAddress, uint8_t *data, size_t length, UsbTimeout timeout);
    UsbStatus Submit(std::unique_ptr<UsbPendingTransfer> pending);
    UsbResult<std::unique_ptr<UsbPendingTransfer>> AllocatePendingTransfer(UsbTransferCallback callback);

    void TransferRetired(libusb_transfer *transfer) override;
    void TransferFinished() override;
};
