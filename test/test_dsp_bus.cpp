#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "../include/dsp_bus.hpp"
#include "../include/exceptions.hpp"
#include "fakes.hpp"

class DspBusTest : public ::testing::Test {
protected:
    void build(uint32_t timeout_ms = 1000, size_t granularity = 1) {
        config_ = makeTestConfig();
        std::unique_ptr<FakeTransport> transport(new FakeTransport(config_.getSafeloadLayout(), granularity));
        fake_ = transport.get();
        events_ = std::make_shared<std::vector<FakeGpio::Event>>();
        std::vector<PinDescriptor> pins;
        pins.push_back(makePin(PinPurpose::RESET, 17, false, false));
        pins_ = std::make_shared<PinController>(std::unique_ptr<GpioDriver>(new FakeGpio(events_)), pins, 0, 0);
        bus_ = std::make_shared<DspBus>(std::move(transport), pins_, config_.getChipConfig(), timeout_ms);
    }

    ConfigManager config_;
    FakeTransport* fake_ = nullptr;
    std::shared_ptr<std::vector<FakeGpio::Event>> events_;
    std::shared_ptr<PinController> pins_;
    std::shared_ptr<DspBus> bus_;
};

TEST_F(DspBusTest, AccessBeforeReadyIsNotReadyAndNeverReachesTheWire) {
    build();
    EXPECT_FALSE(bus_->isReady());
    EXPECT_THROW(bus_->read(0x0020, 4), NotReadyError);
    EXPECT_THROW(bus_->write(0x0020, ByteBuffer(4, 0)), NotReadyError);
    EXPECT_TRUE(fake_->calls().empty());
}

TEST_F(DspBusTest, BringUpStartsTransportAndPins) {
    build();
    bus_->bringUp();
    EXPECT_TRUE(fake_->begun());
    EXPECT_TRUE(bus_->isReady());
    EXPECT_EQ(events_->size(), 3u);
    EXPECT_THROW(bus_->bringUp(), InvalidRequestError);

    bus_->write(0x0020, ByteBuffer({0x00, 0x40, 0x00, 0x00}));
    EXPECT_EQ(bus_->read(0x0020, 4), ByteBuffer({0x00, 0x40, 0x00, 0x00}));
    BusStatistics stats = bus_->statistics();
    EXPECT_EQ(stats.reads, 1u);
    EXPECT_EQ(stats.writes, 1u);
    EXPECT_EQ(stats.failures, 0u);
}

TEST_F(DspBusTest, RejectsBadLengthsAndAddresses) {
    build(1000, 2);
    bus_->bringUp();
    EXPECT_THROW(bus_->read(0x0020, 0), InvalidRequestError);
    EXPECT_THROW(bus_->read(0x0020, 3), InvalidRequestError);
    EXPECT_THROW(bus_->write(0xFFFF, ByteBuffer(8, 0)), InvalidRequestError);
    EXPECT_NO_THROW(bus_->write(0xFFFF, ByteBuffer(4, 0)));
    EXPECT_EQ(fake_->calls().size(), 1u);
}

TEST_F(DspBusTest, AddressSpaceComesFromTheChipConfig) {
    config_ = makeTestConfig();
    config_.loadFromJson("{\"dsp\":{\"chip\":{\"address_space\":2048}}}");
    std::unique_ptr<FakeTransport> transport(new FakeTransport(config_.getSafeloadLayout()));
    FakeTransport* fake = transport.get();
    auto events = std::make_shared<std::vector<FakeGpio::Event>>();
    auto pins = std::make_shared<PinController>(std::unique_ptr<GpioDriver>(new FakeGpio(events)),
                                                std::vector<PinDescriptor>(), 0, 0);
    DspBus bus(std::move(transport), pins, config_.getChipConfig(), 1000);
    bus.bringUp();
    EXPECT_THROW(bus.read(0x0800, 4), InvalidRequestError);
    EXPECT_NO_THROW(bus.read(0x07FF, 4));
    EXPECT_EQ(fake->calls().size(), 1u);
}

TEST_F(DspBusTest, TransportFailuresSurfaceAsBusErrorWithoutRetry) {
    build();
    bus_->bringUp();
    fake_->failNextWrites(1);
    EXPECT_THROW(bus_->write(0x0020, ByteBuffer(4, 0)), BusError);
    EXPECT_EQ(fake_->writesTo(0x0020), 1u);
    EXPECT_EQ(bus_->statistics().failures, 1u);

    fake_->setShortReads(true);
    EXPECT_THROW(bus_->read(0x0020, 4), BusError);
    fake_->setShortReads(false);
    EXPECT_NO_THROW(bus_->read(0x0020, 4));
}

TEST_F(DspBusTest, DeadlineOverrunIsABusErrorAndReleasesTheLock) {
    build(5);
    bus_->bringUp();
    fake_->setCallDelay(std::chrono::milliseconds(30));
    EXPECT_THROW(bus_->read(0x0020, 4), BusError);
    fake_->setCallDelay(std::chrono::milliseconds(0));
    EXPECT_NO_THROW(bus_->read(0x0020, 4));
}

TEST_F(DspBusTest, ConcurrentRequestsNeverOverlapOnTheWire) {
    build();
    bus_->bringUp();
    fake_->setCallDelay(std::chrono::milliseconds(1));
    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.push_back(std::thread([this, t]() {
            for (int n = 0; n < 10; ++n) {
                bus_->write((BusAddress)(0x0100 + t), ByteBuffer({0, 0, 0, (uint8_t)n}));
                bus_->read((BusAddress)(0x0100 + t), 4);
            }
        }));
    }
    for (auto& th : threads) th.join();
    EXPECT_FALSE(fake_->overlapDetected());
    EXPECT_EQ(fake_->calls().size(), 120u);
    EXPECT_EQ(bus_->statistics().writes, 60u);
}

TEST_F(DspBusTest, SessionHoldsOffOtherCallers) {
    build();
    bus_->bringUp();
    std::atomic<bool> other_done(false);
    std::thread other;
    {
        DspBus::Session session = bus_->acquire();
        other = std::thread([this, &other_done]() {
            bus_->write(0x0030, ByteBuffer(4, 0));
            other_done = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        EXPECT_FALSE(other_done.load());
        session.write(0x0031, ByteBuffer(4, 0));
    }
    other.join();
    EXPECT_TRUE(other_done.load());
    std::vector<FakeTransport::Call> calls = fake_->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].address, 0x0031);
    EXPECT_EQ(calls[1].address, 0x0030);
}

TEST_F(DspBusTest, HardResetRunsUnderTheBusLock) {
    build();
    bus_->bringUp();
    events_->clear();
    bus_->hardReset();
    EXPECT_EQ(events_->size(), 2u);
    EXPECT_TRUE(bus_->isReady());
}
