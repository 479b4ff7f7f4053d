#pragma once
#include <stdint.h>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include "bus_transport.hpp"
#include "config_manager.hpp"
#include "pin_controller.hpp"

struct BusStatistics {
    uint32_t reads = 0;
    uint32_t writes = 0;
    uint32_t failures = 0;
};

// Shared handle to the DSP's register bus. Owns the transport and the one
// lock every register access goes through: operations are granted in
// arrival order, one at a time, and only after the pin controller has
// brought the chip to READY.
class DspBus {
public:
    // Exclusive hold on the bus for a multi-step sequence. Released on destruction.
    class Session {
    public:
        Session(Session&& other);
        ~Session();
        ByteBuffer read(BusAddress address, size_t length);
        void write(BusAddress address, const ByteBuffer& data);

    private:
        friend class DspBus;
        explicit Session(DspBus* bus);
        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;
        Session& operator=(Session&&) = delete;
        DspBus* bus_;
    };

    DspBus(std::unique_ptr<BusTransport> transport, std::shared_ptr<PinController> pins,
           const ChipConfig& chip, uint32_t timeout_ms);
    ~DspBus();

    // Starts the transport and runs the pin startup sequence while holding the bus.
    void bringUp();
    void hardReset();
    void setSelfBoot(bool enabled);

    ByteBuffer read(BusAddress address, size_t length);
    void write(BusAddress address, const ByteBuffer& data);

    // Blocks until every earlier request has released the bus.
    Session acquire();

    bool isReady() const;
    BusStatistics statistics() const;
    const char* transportName() const;
    size_t wordSize() const { return chip_.word_size; }
    uint32_t addressSpace() const { return chip_.address_space; }

private:
    std::unique_ptr<BusTransport> transport_;
    std::shared_ptr<PinController> pins_;
    ChipConfig chip_;
    uint32_t timeout_ms_;

    std::mutex mutex_;
    std::condition_variable turn_;
    uint64_t next_ticket_ = 0;
    uint64_t now_serving_ = 0;

    std::atomic<uint32_t> reads_;
    std::atomic<uint32_t> writes_;
    std::atomic<uint32_t> failures_;

    void lock();
    void unlock();
    void checkAccess(BusAddress address, size_t length) const;
    ByteBuffer lockedRead(BusAddress address, size_t length);
    void lockedWrite(BusAddress address, const ByteBuffer& data);
};
