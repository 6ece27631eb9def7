#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <libusb.h>

#include "protocol.h"
#include "transport.h"

// Interface 4 is the HID channel (buttons, pads, LEDs), interface 5 the
// display channel.
static constexpr int MK3_HID_INTERFACE     = 4;
static constexpr int MK3_DISPLAY_INTERFACE = 5;

static constexpr uint8_t HID_EP_IN      = 0x83;  // interrupt IN
static constexpr uint8_t HID_EP_OUT     = 0x03;  // interrupt OUT
static constexpr uint8_t DISPLAY_EP_OUT = 0x04;  // bulk OUT

// Largest HID report the controller sends
static constexpr int HID_REPORT_MAX_SIZE = 64;

// Timeout for outbound USB transfers in milliseconds
static constexpr unsigned int USB_TIMEOUT_MS = 2000;

class UsbDevice {
public:
    UsbDevice();
    ~UsbDevice();

    // Non-copyable
    UsbDevice(const UsbDevice&) = delete;
    UsbDevice& operator=(const UsbDevice&) = delete;

    // Open the controller by VID/PID and claim the HID interface (detaching
    // the kernel driver). The display interface is claimed when possible;
    // failing that only leaves display_claimed() false.
    // Throws TransportError if the device or the HID interface is unavailable.
    void open(uint16_t vid = MK3_VID, uint16_t pid = MK3_PID);

    // Release interfaces and reattach kernel drivers
    void close();

    // Throws TransportError on failure or short write.
    void interrupt_write(uint8_t endpoint, const Bytes& data);
    void bulk_write(uint8_t endpoint, const Bytes& data);

    // Returns the number of bytes received, 0 on timeout.
    // Throws TransportError on any other failure.
    int try_interrupt_read(uint8_t endpoint, uint8_t* buf, int buf_size,
                           unsigned int timeout_ms);

    // Print all USB interfaces and endpoints for this device to stdout.
    void probe();

    bool is_open() const { return _handle != nullptr; }
    bool display_claimed() const { return _display_claimed; }

private:
    libusb_context*       _ctx    = nullptr;
    libusb_device_handle* _handle = nullptr;

    bool _detached_hid     = false;
    bool _detached_display = false;
    bool _display_claimed  = false;

    void _claim_interface(int iface, bool& detached_flag);
    void _release_interface(int iface, bool detached_flag);
};

// HID reports over the interrupt endpoints of interface 4.
class UsbInterruptTransport : public Transport {
public:
    explicit UsbInterruptTransport(std::shared_ptr<UsbDevice> dev) : _dev(std::move(dev)) {}

    void  write(const Bytes& data) override;
    Bytes read(unsigned int timeout_ms) override;

private:
    std::shared_ptr<UsbDevice> _dev;
};

// Display packets over the bulk endpoint of interface 5. Write-only.
class UsbBulkTransport : public Transport {
public:
    explicit UsbBulkTransport(std::shared_ptr<UsbDevice> dev) : _dev(std::move(dev)) {}

    void  write(const Bytes& data) override;
    Bytes read(unsigned int timeout_ms) override;

private:
    std::shared_ptr<UsbDevice> _dev;
};
