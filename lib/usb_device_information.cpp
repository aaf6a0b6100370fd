#include <iomanip>

#include "usb_device_information.hpp"

std::ostream &operator<<(std::ostream &os, const UsbDeviceInformation &information)
{
    std::ios_base::fmtflags flags = os.flags();
    char fill = os.fill();

    os << std::hex << std::nouppercase << std::setfill('0')
       << std::setw(4) << information.vendorId << ":" << std::setw(4) << information.productId;
    os.flags(flags);
    os.fill(fill);

    os << " " << information.vendor.value_or("[Unknown Vendor]")
       << " " << information.product.value_or("[Unknown Product]");
    if (information.serial) {
        os << " (" << *information.serial << ")";
    }

    return os;
}

bool UsbDeviceSelector::Matches(const UsbDeviceInformation &device) const
{
    if (vendorId && *vendorId != device.vendorId) {
        return false;
    }

    if (productId && *productId != device.productId) {
        return false;
    }

    if (serial) {
        if (!device.serial || *serial != *device.serial) {
            return false;
        }
    }

    return true;
}
