#include "../include/dsp_bus.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <chrono>
#include <utility>

DspBus::Session::Session(DspBus* bus) : bus_(bus) {}

DspBus::Session::Session(Session&& other) : bus_(other.bus_) {
    other.bus_ = nullptr;
}

DspBus::Session::~Session() {
    if (bus_) bus_->unlock();
}

ByteBuffer DspBus::Session::read(BusAddress address, size_t length) {
    return bus_->lockedRead(address, length);
}

void DspBus::Session::write(BusAddress address, const ByteBuffer& data) {
    bus_->lockedWrite(address, data);
}

DspBus::DspBus(std::unique_ptr<BusTransport> transport, std::shared_ptr<PinController> pins,
               const ChipConfig& chip, uint32_t timeout_ms)
    : transport_(std::move(transport)), pins_(std::move(pins)), chip_(chip), timeout_ms_(timeout_ms),
      reads_(0), writes_(0), failures_(0) {
}

DspBus::~DspBus() {}

void DspBus::lock() {
    std::unique_lock<std::mutex> guard(mutex_);
    uint64_t ticket = next_ticket_++;
    turn_.wait(guard, [this, ticket] { return now_serving_ == ticket; });
}

void DspBus::unlock() {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        ++now_serving_;
    }
    turn_.notify_all();
}

DspBus::Session DspBus::acquire() {
    lock();
    return Session(this);
}

void DspBus::bringUp() {
    Session session = acquire();
    if (pins_->state() != PinState::UNINITIALIZED) {
        throw InvalidRequestError("DSP bus already brought up");
    }
    Logger::info("[DspBus] Starting %s transport", transport_->name());
    transport_->begin();
    pins_->begin();
}

void DspBus::hardReset() {
    Session session = acquire();
    pins_->hardReset();
}

void DspBus::setSelfBoot(bool enabled) {
    Session session = acquire();
    pins_->setSelfBoot(enabled);
}

ByteBuffer DspBus::read(BusAddress address, size_t length) {
    Session session = acquire();
    return session.read(address, length);
}

void DspBus::write(BusAddress address, const ByteBuffer& data) {
    Session session = acquire();
    session.write(address, data);
}

bool DspBus::isReady() const {
    return pins_->isReady();
}

BusStatistics DspBus::statistics() const {
    BusStatistics stats;
    stats.reads = reads_;
    stats.writes = writes_;
    stats.failures = failures_;
    return stats;
}

const char* DspBus::transportName() const {
    return transport_->name();
}

void DspBus::checkAccess(BusAddress address, size_t length) const {
    if (!pins_->isReady()) {
        throw NotReadyError("DSP is not ready (pin state: " + std::string(pinStateToString(pins_->state())) + ")");
    }
    if (length == 0) {
        throw InvalidRequestError("transfer length must be positive");
    }
    size_t granularity = transport_->transferGranularity();
    if (length % granularity != 0) {
        throw InvalidRequestError("transfer length " + std::to_string(length) +
                                  " is not a multiple of " + std::to_string(granularity));
    }
    // Register addresses count words, not bytes
    uint32_t last = (uint32_t)address + (uint32_t)((length + chip_.word_size - 1) / chip_.word_size) - 1;
    if (address >= chip_.address_space || last >= chip_.address_space) {
        throw InvalidRequestError("register span at " + std::to_string(address) +
                                  " leaves the chip's address space");
    }
}

ByteBuffer DspBus::lockedRead(BusAddress address, size_t length) {
    checkAccess(address, length);
    auto started = std::chrono::steady_clock::now();
    ByteBuffer data;
    try {
        data = transport_->read(address, length);
    } catch (const BusError& e) {
        failures_++;
        Logger::warn("[DspBus] Read of %u bytes at 0x%04X failed: %s", (unsigned)length, address, e.what());
        throw;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    if ((uint32_t)elapsed.count() > timeout_ms_) {
        failures_++;
        throw BusError("read at " + std::to_string(address) + " exceeded the " +
                       std::to_string(timeout_ms_) + " ms deadline");
    }
    if (data.size() != length) {
        failures_++;
        throw BusError("short read at " + std::to_string(address) + ": got " + std::to_string(data.size()) +
                       " of " + std::to_string(length) + " bytes");
    }
    reads_++;
    return data;
}

void DspBus::lockedWrite(BusAddress address, const ByteBuffer& data) {
    checkAccess(address, data.size());
    auto started = std::chrono::steady_clock::now();
    try {
        transport_->write(address, data);
    } catch (const BusError& e) {
        failures_++;
        Logger::warn("[DspBus] Write of %u bytes at 0x%04X failed: %s", (unsigned)data.size(), address, e.what());
        throw;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    if ((uint32_t)elapsed.count() > timeout_ms_) {
        failures_++;
        throw BusError("write at " + std::to_string(address) + " exceeded the " +
                       std::to_string(timeout_ms_) + " ms deadline");
    }
    writes_++;
}
