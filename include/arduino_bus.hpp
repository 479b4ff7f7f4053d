#pragma once
#include <stdint.h>
#include <memory>
#include "bus_transport.hpp"
#include "config_manager.hpp"
#include "pin_controller.hpp"

class SPIClass;
class TwoWire;

// SPI framing: chip address byte (address << 1 | R/W), 16-bit register
// address, then the payload, all under one chip-select assertion.
class SpiTransport : public BusTransport {
public:
    explicit SpiTransport(const BusConfig& config);
    ~SpiTransport() override;

    void begin() override;
    ByteBuffer read(BusAddress address, size_t length) override;
    void write(BusAddress address, const ByteBuffer& data) override;
    size_t transferGranularity() const override { return config_.transfer_granularity; }
    const char* name() const override { return "spi"; }

private:
    BusConfig config_;
    SPIClass* spi_ = nullptr;
    bool started_ = false;

    void requireStarted() const;
    void select(uint8_t rw_flag, BusAddress address);
    void deselect();
};

// I2C framing: 16-bit register address after the device address, reads
// use a repeated start.
class I2cTransport : public BusTransport {
public:
    explicit I2cTransport(const BusConfig& config);
    ~I2cTransport() override;

    void begin() override;
    ByteBuffer read(BusAddress address, size_t length) override;
    void write(BusAddress address, const ByteBuffer& data) override;
    size_t transferGranularity() const override { return config_.transfer_granularity; }
    const char* name() const override { return "i2c"; }

private:
    BusConfig config_;
    TwoWire* wire_ = nullptr;
    bool started_ = false;
};

class ArduinoGpio : public GpioDriver {
public:
    void configureOutput(int gpio, bool level) override;
    void writeLevel(int gpio, bool level) override;
};

// Picks the transport named by the bus configuration.
std::unique_ptr<BusTransport> createBusTransport(const BusConfig& config);
