#pragma once
#include <stdint.h>
#include <stddef.h>
#include "types.hpp"

// Byte-level register access to one device on an SPI or I2C bus.
// Implementations throw BusError on any I/O failure and never retry.
// Argument validation and serialization live in DspBus; a transport
// only moves bytes.
class BusTransport {
public:
    virtual ~BusTransport() {}

    // Bring the peripheral up. Called once before the first transaction.
    virtual void begin() = 0;

    virtual ByteBuffer read(BusAddress address, size_t length) = 0;
    virtual void write(BusAddress address, const ByteBuffer& data) = 0;

    // Minimum transfer unit in bytes; every length is a multiple of it
    virtual size_t transferGranularity() const = 0;
    virtual const char* name() const = 0;
};
