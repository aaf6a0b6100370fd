#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "usb_backend.hpp"
#include "usb_event_loop.hpp"

// In-memory stand-in for an OS backend.
//
// It reports four devices. 1d50:615c carries a canned device descriptor.
// Interface 0 can be claimed and owns bulk endpoints 0x81 and 0x02.
// Interface 1 is a permission-denied placeholder owning endpoint 0x83.

constexpr uint16_t FIXTURE_VENDOR_ID = 0x1d50;
constexpr uint16_t FIXTURE_PRODUCT_ID = 0x615c;
constexpr uint64_t FIXTURE_LOCATION = 0x0103;

constexpr uint8_t FIXTURE_INTERFACE = 0;
constexpr uint8_t FIXTURE_PLACEHOLDER_INTERFACE = 1;
constexpr uint8_t FIXTURE_BULK_ENDPOINT = 1;
constexpr uint8_t FIXTURE_OUT_ENDPOINT = 2;
constexpr uint8_t FIXTURE_PLACEHOLDER_ENDPOINT = 3;

// Fill pattern of every bulk read.
constexpr uint8_t FIXTURE_READ_PATTERN = 0xA5;

extern const std::vector<uint8_t> FIXTURE_DEVICE_DESCRIPTOR;

// How often each operation reached the "OS".
struct FixtureOsCalls {
    std::atomic<int> open{0};
    std::atomic<int> controlRead{0};
    std::atomic<int> controlWrite{0};
    std::atomic<int> claim{0};
    std::atomic<int> transfers{0};
};

class FixtureBackendDevice : public UsbBackendDevice {
public:
    FixtureBackendDevice(std::shared_ptr<FixtureOsCalls> calls, std::chrono::milliseconds slice);
    ~FixtureBackendDevice() override;

    // Bulk transfers submitted without blocking are held back until released.
    size_t HeldCount() const;
    void ReleaseHeld();

    std::thread::id GetEventThreadId() const;

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
    struct HeldTransfer {
        UsbReadBuffer buffer;
        size_t length;
        UsbTransferCallback callback;
    };

    std::shared_ptr<FixtureOsCalls> m_calls;
    UsbEventLoop m_eventLoop;

    mutable std::mutex m_mutex;
    std::map<uint8_t, bool> m_claimed;
    std::deque<HeldTransfer> m_held;

    UsbStatus CheckEndpoint(uint8_t endpointAddress) const;
    UsbResult<size_t> CannedControlRead(uint8_t requestType, uint8_t request, uint16_t value,
        uint8_t *data, size_t length);
    UsbStatus Deliver(UsbTransferCallback callback, UsbResult<size_t> result);
};

class FixtureBackend : public UsbBackend {
public:
    explicit FixtureBackend(std::chrono::milliseconds slice = std::chrono::milliseconds(50));

    const char *GetName() const override;

    UsbResult<std::vector<UsbDeviceInformation>> GetDevices() override;

    UsbResult<std::unique_ptr<UsbBackendDevice>> Open(const UsbDeviceInformation &information) override;

    std::shared_ptr<FixtureOsCalls> GetCalls() const { return m_calls; }

    // Non-owning; only valid while the device it came from is open.
    FixtureBackendDevice *GetLastOpened() const { return m_lastOpened; }

private:
    std::chrono::milliseconds m_slice;
    std::shared_ptr<FixtureOsCalls> m_calls;
    FixtureBackendDevice *m_lastOpened = nullptr;
};
