#include "usb.h"

#include <iomanip>
#include <iostream>
#include <sstream>

static std::string usb_error(int r) {
    return libusb_strerror(static_cast<libusb_error>(r));
}

static std::string hex_byte(uint8_t v) {
    std::ostringstream s;
    s << "0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(v);
    return s.str();
}

UsbDevice::UsbDevice() {
    int r = libusb_init(&_ctx);
    if (r < 0)
        throw TransportError("libusb_init failed: " + usb_error(r));
}

UsbDevice::~UsbDevice() {
    close();
    if (_ctx) {
        libusb_exit(_ctx);
        _ctx = nullptr;
    }
}

void UsbDevice::open(uint16_t vid, uint16_t pid) {
    _handle = libusb_open_device_with_vid_pid(_ctx, vid, pid);
    if (!_handle) {
        std::ostringstream ss;
        ss << std::hex << std::setw(4) << std::setfill('0') << vid
           << ":" << std::setw(4) << std::setfill('0') << pid;
        throw TransportError("Could not find or open device " + ss.str() +
                             ". Is the controller plugged in? Try sudo or install the udev rule.");
    }

    try {
        _claim_interface(MK3_HID_INTERFACE, _detached_hid);
    } catch (...) {
        libusb_close(_handle);
        _handle = nullptr;
        throw;
    }

    try {
        _claim_interface(MK3_DISPLAY_INTERFACE, _detached_display);
        _display_claimed = true;
    } catch (const TransportError& e) {
        std::cerr << "Warning: displays unavailable: " << e.what() << "\n";
        _display_claimed = false;
    }
}

void UsbDevice::close() {
    if (!_handle) return;

    if (_display_claimed)
        _release_interface(MK3_DISPLAY_INTERFACE, _detached_display);
    _release_interface(MK3_HID_INTERFACE, _detached_hid);
    _display_claimed = false;

    libusb_close(_handle);
    _handle = nullptr;
}

void UsbDevice::interrupt_write(uint8_t endpoint, const Bytes& data) {
    if (!_handle)
        throw TransportError("Device not open");

    // libusb wants a non-const buffer even for OUT transfers
    Bytes buf(data);
    int transferred = 0;
    int r = libusb_interrupt_transfer(_handle, endpoint, buf.data(),
                                      static_cast<int>(buf.size()), &transferred,
                                      USB_TIMEOUT_MS);
    if (r < 0)
        throw TransportError("Interrupt transfer (write) on EP " + hex_byte(endpoint) +
                             " failed: " + usb_error(r));
    if (transferred != static_cast<int>(buf.size()))
        throw TransportError("Incomplete write: sent " + std::to_string(transferred) +
                             " of " + std::to_string(buf.size()) + " bytes");
}

void UsbDevice::bulk_write(uint8_t endpoint, const Bytes& data) {
    if (!_handle)
        throw TransportError("Device not open");

    Bytes buf(data);
    int transferred = 0;
    int r = libusb_bulk_transfer(_handle, endpoint, buf.data(),
                                 static_cast<int>(buf.size()), &transferred,
                                 USB_TIMEOUT_MS);
    if (r < 0)
        throw TransportError("Bulk transfer on EP " + hex_byte(endpoint) +
                             " failed: " + usb_error(r));
    if (transferred != static_cast<int>(buf.size()))
        throw TransportError("Incomplete bulk write: sent " + std::to_string(transferred) +
                             " of " + std::to_string(buf.size()) + " bytes");
}

int UsbDevice::try_interrupt_read(uint8_t endpoint, uint8_t* buf, int buf_size,
                                  unsigned int timeout_ms) {
    if (!_handle)
        throw TransportError("Device not open");

    int transferred = 0;
    int r = libusb_interrupt_transfer(_handle, endpoint, buf, buf_size,
                                      &transferred, timeout_ms);

    if (r == LIBUSB_ERROR_TIMEOUT) return 0;
    if (r < 0)
        throw TransportError("Interrupt transfer failed on EP " + hex_byte(endpoint) +
                             ": " + usb_error(r));
    return transferred;
}

void UsbDevice::probe() {
    if (!_handle) {
        std::cout << "Device not open\n";
        return;
    }

    libusb_device* dev = libusb_get_device(_handle);
    libusb_config_descriptor* cfg = nullptr;

    if (libusb_get_active_config_descriptor(dev, &cfg) < 0) {
        std::cout << "Could not get config descriptor\n";
        return;
    }

    std::cout << "USB descriptor: " << static_cast<int>(cfg->bNumInterfaces)
              << " interface(s)\n";

    for (int i = 0; i < cfg->bNumInterfaces; ++i) {
        const auto& iface = cfg->interface[i];
        for (int a = 0; a < iface.num_altsetting; ++a) {
            const auto& alt = iface.altsetting[a];
            int num = alt.bInterfaceNumber;
            std::cout << "  Interface " << num
                      << " (class " << static_cast<int>(alt.bInterfaceClass)
                      << ", subclass " << static_cast<int>(alt.bInterfaceSubClass)
                      << ")  endpoints: " << static_cast<int>(alt.bNumEndpoints);
            if (num == MK3_HID_INTERFACE)     std::cout << "  [HID]";
            if (num == MK3_DISPLAY_INTERFACE) std::cout << "  [display"
                                                        << (_display_claimed ? "" : ", not claimed")
                                                        << "]";
            std::cout << "\n";

            for (int e = 0; e < alt.bNumEndpoints; ++e) {
                const auto& ep = alt.endpoint[e];
                uint8_t addr  = ep.bEndpointAddress;
                std::string dir = (addr & 0x80) ? "IN " : "OUT";
                std::string type;
                switch (ep.bmAttributes & 0x03) {
                    case 0: type = "Control";     break;
                    case 1: type = "Isochronous"; break;
                    case 2: type = "Bulk";        break;
                    case 3: type = "Interrupt";   break;
                }
                std::cout << "    EP " << hex_byte(addr) << "  " << dir << "  " << type
                          << "  maxPacket=" << ep.wMaxPacketSize << "\n";
            }
        }
    }

    libusb_free_config_descriptor(cfg);
}

// --- private helpers ---

void UsbDevice::_claim_interface(int iface, bool& detached_flag) {
    detached_flag = false;

    if (libusb_kernel_driver_active(_handle, iface) == 1) {
        int r = libusb_detach_kernel_driver(_handle, iface);
        if (r < 0)
            throw TransportError("Failed to detach kernel driver from interface " +
                                 std::to_string(iface) + ": " + usb_error(r));
        detached_flag = true;
    }

    int r = libusb_claim_interface(_handle, iface);
    if (r < 0) {
        if (detached_flag) {
            libusb_attach_kernel_driver(_handle, iface);
            detached_flag = false;
        }
        throw TransportError("Failed to claim interface " + std::to_string(iface) +
                             ": " + usb_error(r));
    }
}

void UsbDevice::_release_interface(int iface, bool detached_flag) {
    libusb_release_interface(_handle, iface);
    if (detached_flag) {
        libusb_attach_kernel_driver(_handle, iface);
    }
}

// -----------------------------------------------------------------------
// Transports
// -----------------------------------------------------------------------

void UsbInterruptTransport::write(const Bytes& data) {
    _dev->interrupt_write(HID_EP_OUT, data);
}

Bytes UsbInterruptTransport::read(unsigned int timeout_ms) {
    Bytes buf(HID_REPORT_MAX_SIZE);
    int n = _dev->try_interrupt_read(HID_EP_IN, buf.data(), HID_REPORT_MAX_SIZE, timeout_ms);
    buf.resize(static_cast<size_t>(n));
    return buf;
}

void UsbBulkTransport::write(const Bytes& data) {
    if (!_dev->display_claimed())
        throw TransportError("Display interface not claimed");
    _dev->bulk_write(DISPLAY_EP_OUT, data);
}

Bytes UsbBulkTransport::read(unsigned int) {
    throw TransportError("Display endpoint is write-only");
}
