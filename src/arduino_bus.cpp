#include "../include/arduino_bus.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <Arduino.h>
#include <SPI.h>
#include <Wire.h>

// ---- SPI ----

SpiTransport::SpiTransport(const BusConfig& config) : config_(config) {}

SpiTransport::~SpiTransport() {
    if (spi_) {
        spi_->end();
        delete spi_;
    }
}

void SpiTransport::begin() {
    if (started_) return;
    spi_ = new SPIClass(config_.bus_number);
    spi_->begin();
    pinMode(config_.cs_gpio, OUTPUT);
    digitalWrite(config_.cs_gpio, HIGH);
    started_ = true;
    Logger::info("[SPI] Bus %u up at %u Hz, CS on GPIO %d", config_.bus_number, (unsigned)config_.clock_hz,
                 config_.cs_gpio);
}

void SpiTransport::requireStarted() const {
    if (!started_) {
        throw BusError("SPI bus not started");
    }
}

void SpiTransport::select(uint8_t rw_flag, BusAddress address) {
    spi_->beginTransaction(SPISettings(config_.clock_hz, MSBFIRST, SPI_MODE3));
    digitalWrite(config_.cs_gpio, LOW);
    spi_->transfer((uint8_t)((config_.device_address << 1) | rw_flag));
    spi_->transfer((uint8_t)(address >> 8));
    spi_->transfer((uint8_t)(address & 0xFF));
}

void SpiTransport::deselect() {
    digitalWrite(config_.cs_gpio, HIGH);
    spi_->endTransaction();
}

ByteBuffer SpiTransport::read(BusAddress address, size_t length) {
    requireStarted();
    if (length > config_.max_transfer_bytes) {
        throw BusError("SPI read of " + std::to_string(length) + " bytes exceeds the transfer limit");
    }
    ByteBuffer data(length, 0);
    select(1, address);
    for (size_t i = 0; i < length; ++i) {
        data[i] = spi_->transfer(0x00);
    }
    deselect();
    return data;
}

void SpiTransport::write(BusAddress address, const ByteBuffer& data) {
    requireStarted();
    if (data.size() > config_.max_transfer_bytes) {
        throw BusError("SPI write of " + std::to_string(data.size()) + " bytes exceeds the transfer limit");
    }
    select(0, address);
    for (uint8_t b : data) {
        spi_->transfer(b);
    }
    deselect();
}

// ---- I2C ----

I2cTransport::I2cTransport(const BusConfig& config) : config_(config) {}

I2cTransport::~I2cTransport() {
    if (wire_ && started_) {
        wire_->end();
    }
}

void I2cTransport::begin() {
    if (started_) return;
    wire_ = config_.bus_number == 1 ? &Wire1 : &Wire;
    // Register address plus payload must fit the driver's buffer
    wire_->setBufferSize(config_.max_transfer_bytes + 2);
    if (!wire_->begin(config_.sda_gpio, config_.scl_gpio, config_.clock_hz)) {
        throw BusError("I2C bus " + std::to_string(config_.bus_number) + " failed to start");
    }
    wire_->setTimeOut((uint16_t)config_.timeout_ms);
    started_ = true;
    Logger::info("[I2C] Bus %u up at %u Hz, device 0x%02X (SDA %d, SCL %d)", config_.bus_number,
                 (unsigned)config_.clock_hz, config_.device_address, config_.sda_gpio, config_.scl_gpio);
}

ByteBuffer I2cTransport::read(BusAddress address, size_t length) {
    if (!started_) {
        throw BusError("I2C bus not started");
    }
    wire_->beginTransmission(config_.device_address);
    wire_->write((uint8_t)(address >> 8));
    wire_->write((uint8_t)(address & 0xFF));
    uint8_t status = wire_->endTransmission(false);
    if (status != 0) {
        throw BusError("I2C address phase at " + std::to_string(address) + " failed with status " +
                       std::to_string(status));
    }

    size_t received = wire_->requestFrom((uint16_t)config_.device_address, length, true);
    if (received != length) {
        throw BusError("I2C short read at " + std::to_string(address) + ": " + std::to_string(received) + " of " +
                       std::to_string(length) + " bytes");
    }
    ByteBuffer data(length, 0);
    for (size_t i = 0; i < length; ++i) {
        int b = wire_->read();
        if (b < 0) {
            throw BusError("I2C receive buffer ran dry at byte " + std::to_string(i));
        }
        data[i] = (uint8_t)b;
    }
    return data;
}

void I2cTransport::write(BusAddress address, const ByteBuffer& data) {
    if (!started_) {
        throw BusError("I2C bus not started");
    }
    wire_->beginTransmission(config_.device_address);
    wire_->write((uint8_t)(address >> 8));
    wire_->write((uint8_t)(address & 0xFF));
    size_t queued = wire_->write(data.data(), data.size());
    if (queued != data.size()) {
        // Release the bus before reporting
        (void)wire_->endTransmission(true);
        throw BusError("I2C write at " + std::to_string(address) + " overflowed the transmit buffer");
    }
    uint8_t status = wire_->endTransmission(true);
    if (status != 0) {
        throw BusError("I2C write at " + std::to_string(address) + " failed with status " + std::to_string(status));
    }
}

// ---- GPIO ----

void ArduinoGpio::configureOutput(int gpio, bool level) {
    pinMode(gpio, OUTPUT);
    digitalWrite(gpio, level ? HIGH : LOW);
}

void ArduinoGpio::writeLevel(int gpio, bool level) {
    digitalWrite(gpio, level ? HIGH : LOW);
}

std::unique_ptr<BusTransport> createBusTransport(const BusConfig& config) {
    if (config.kind == BusKind::I2C) {
        return std::unique_ptr<BusTransport>(new I2cTransport(config));
    }
    return std::unique_ptr<BusTransport>(new SpiTransport(config));
}
