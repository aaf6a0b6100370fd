#pragma once

#include <cstddef>
#include <memory>
#include <sys/types.h>
#include <libusb-1.0/libusb.h>

// Owning wrappers for the libusb objects the backend holds on to. Each one
// releases its object when it goes out of scope.

struct LibusbContextDeleter {
    void operator()(libusb_context *ctx) const
    {
        libusb_exit(ctx);
    }
};
using LibusbContextPtr = std::unique_ptr<libusb_context, LibusbContextDeleter>;

struct LibusbDeviceDeleter {
    void operator()(libusb_device *device) const
    {
        libusb_unref_device(device);
    }
};
// Holds one reference on a libusb_device.
using LibusbDevicePtr = std::unique_ptr<libusb_device, LibusbDeviceDeleter>;

struct LibusbDeviceHandleDeleter {
    void operator()(libusb_device_handle *handle) const
    {
        libusb_close(handle);
    }
};
using LibusbDeviceHandlePtr = std::unique_ptr<libusb_device_handle, LibusbDeviceHandleDeleter>;

struct LibusbConfigDescriptorDeleter {
    void operator()(libusb_config_descriptor *config) const
    {
        libusb_free_config_descriptor(config);
    }
};
using LibusbConfigDescriptorPtr = std::unique_ptr<libusb_config_descriptor, LibusbConfigDescriptorDeleter>;

struct LibusbTransferDeleter {
    void operator()(libusb_transfer *transfer) const
    {
        libusb_free_transfer(transfer);
    }
};
using LibusbTransferPtr = std::unique_ptr<libusb_transfer, LibusbTransferDeleter>;

// Device list from libusb_get_device_list. The list holds a reference on
// every device in it until it is destroyed.
class LibusbDeviceList {
public:
    LibusbDeviceList() : m_list{nullptr}, m_count{0}
    {}
    ~LibusbDeviceList()
    {
        Reset();
    }

    LibusbDeviceList(const LibusbDeviceList &) = delete;
    LibusbDeviceList &operator=(const LibusbDeviceList &) = delete;

    // Returns the libusb result: the device count, or a negative error code.
    ssize_t Load(libusb_context *ctx)
    {
        Reset();
        ssize_t count = libusb_get_device_list(ctx, &m_list);
        if (count < 0) {
            m_list = nullptr;
            return count;
        }
        m_count = static_cast<size_t>(count);
        return count;
    }

    void Reset()
    {
        if (m_list) {
            libusb_free_device_list(m_list, 1);
            m_list = nullptr;
        }
        m_count = 0;
    }

    size_t Size() const { return m_count; }
    libusb_device *operator[](size_t index) const { return m_list[index]; }

private:
    libusb_device **m_list;
    size_t m_count;
};
