#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using Bytes = std::vector<uint8_t>;

// Malformed, truncated or wrongly-tagged packet received from the device.
// Not recoverable by retrying; the poll loop drops the packet and continues.
class InvalidPacket : public std::runtime_error {
public:
    explicit InvalidPacket(const std::string& what)
        : std::runtime_error("Invalid packet: " + what) {}
};

// Caller passed an out-of-range id, region or buffer. Always raised before
// anything is written to the device.
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what)
        : std::invalid_argument(what) {}
};

// Failure reported by the byte transport underneath the device.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what)
        : std::runtime_error(what) {}
};

// Raw duplex byte channel to the controller.
//
// read() blocks for at most timeout_ms and returns an empty buffer when
// nothing arrived in that time. Both calls throw TransportError on failure.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void  write(const Bytes& data) = 0;
    virtual Bytes read(unsigned int timeout_ms) = 0;
};
