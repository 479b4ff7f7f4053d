#include <gtest/gtest.h>
#include <cmath>
#include <thread>
#include <vector>
#include "../include/fixed_point_codec.hpp"
#include "../include/parameter_translator.hpp"
#include "fakes.hpp"

namespace {

ParameterRequest makeRequest(ParameterAction action, const std::string& name) {
    ParameterRequest request;
    request.request_id = 7;
    request.action = action;
    request.name = name;
    return request;
}

} // namespace

TEST(ParameterTranslator, SingleWordWriteIsOnePlainTransfer) {
    TestRig rig;
    rig.start();
    ParameterTranslator& params = rig.context->parameterTranslator();

    WriteOutcome outcome = params.write("master_volume", std::vector<double>(1, 0.5));
    EXPECT_FALSE(outcome.range_clamped);
    ASSERT_EQ(outcome.applied.size(), 1u);
    EXPECT_DOUBLE_EQ(outcome.applied[0], 0.5);

    std::vector<FakeTransport::Call> calls = rig.fake->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_TRUE(calls[0].is_write);
    EXPECT_EQ(calls[0].address, 0x0020);
    EXPECT_EQ(calls[0].data, ByteBuffer({0x00, 0x40, 0x00, 0x00}));
    EXPECT_EQ(rig.fake->commitTriggers(), 0);

    std::vector<double> back = params.read("master_volume");
    ASSERT_EQ(back.size(), 1u);
    EXPECT_DOUBLE_EQ(back[0], 0.5);
}

TEST(ParameterTranslator, MultiWordWriteGoesThroughOneSafeload) {
    TestRig rig;
    rig.start();
    std::vector<double> coefficients;
    coefficients.push_back(0.125);
    coefficients.push_back(0.25);
    coefficients.push_back(-0.125);
    rig.context->parameterTranslator().write("eq_band1", coefficients);

    EXPECT_EQ(rig.fake->calls().size(), 9u);
    EXPECT_EQ(rig.fake->commitTriggers(), 1);
    for (BusAddress a = 0x0040; a <= 0x0042; ++a) {
        EXPECT_EQ(rig.fake->writesTo(a), 0u) << a;
    }
    EXPECT_EQ(rig.fake->writesTo(rig.config.getSafeloadLayout().pending_count_address), 1u);
    EXPECT_EQ(rig.fake->peek(0x0042), 0xFFF00000u);

    std::vector<double> back = rig.context->parameterTranslator().read("eq_band1");
    ASSERT_EQ(back.size(), 3u);
    EXPECT_DOUBLE_EQ(back[1], 0.25);
    EXPECT_DOUBLE_EQ(back[2], -0.125);
}

TEST(ParameterTranslator, TooManyWordsForTheSlotsTouchesNothing) {
    TestRig rig;
    rig.start();
    EXPECT_THROW(rig.context->parameterTranslator().write("crossover", std::vector<double>(6, 0.1)),
                 TransactionTooLargeError);
    EXPECT_TRUE(rig.fake->calls().empty());

    ParameterRequest request = makeRequest(ParameterAction::WRITE, "crossover");
    request.values.assign(6, 0.1);
    ParameterResult result = rig.context->parameterTranslator().execute(request);
    EXPECT_EQ(result.status, ParameterStatus::TRANSACTION_TOO_LARGE);
    EXPECT_EQ(result.request_id, 7u);
    EXPECT_TRUE(rig.fake->calls().empty());
}

TEST(ParameterTranslator, UnknownNameNeverReachesTheBus) {
    TestRig rig;
    rig.start();
    EXPECT_THROW(rig.context->parameterTranslator().write("no_such_gain", std::vector<double>(1, 1.0)),
                 UnknownParameterError);
    EXPECT_THROW(rig.context->parameterTranslator().read("no_such_gain"), UnknownParameterError);
    ParameterResult result =
        rig.context->parameterTranslator().execute(makeRequest(ParameterAction::READ, "no_such_gain"));
    EXPECT_EQ(result.status, ParameterStatus::UNKNOWN_PARAMETER);
    EXPECT_FALSE(result.error_details.empty());
    EXPECT_TRUE(rig.fake->calls().empty());
}

TEST(ParameterTranslator, ValueCountMustMatchTheSpan) {
    TestRig rig;
    rig.start();
    EXPECT_THROW(rig.context->parameterTranslator().write("eq_band1", std::vector<double>(2, 0.1)),
                 InvalidRequestError);
    EXPECT_THROW(rig.context->parameterTranslator().write("master_volume", std::vector<double>()),
                 InvalidRequestError);
    EXPECT_TRUE(rig.fake->calls().empty());
}

TEST(ParameterTranslator, OutOfRangeValuesAreClampedAndFlagged) {
    TestRig rig;
    rig.start();
    WriteOutcome outcome = rig.context->parameterTranslator().write("master_volume", std::vector<double>(1, 100.0));
    EXPECT_TRUE(outcome.range_clamped);
    EXPECT_DOUBLE_EQ(outcome.applied[0], encodingMaximum(ParameterEncoding::fixedPoint(5, 23)));
    EXPECT_EQ(rig.fake->peek(0x0020), 0x07FFFFFFu);
}

TEST(ParameterTranslator, EncodingFollowsTheCatalogRow) {
    TestRig rig;
    rig.start();
    ParameterTranslator& params = rig.context->parameterTranslator();

    params.write("mute", std::vector<double>(1, 1.0));
    EXPECT_EQ(rig.fake->peek(0x0021), 1u);

    params.write("delay_samples", std::vector<double>(1, 480.0));
    EXPECT_EQ(rig.fake->peek(0x0060), 480u);

    // The alias reaches the same register through a different encoding
    params.write("master_volume_raw", std::vector<double>(1, -2.0));
    EXPECT_EQ(rig.fake->peek(0x0020), 0xFFFFFFFEu);
    EXPECT_DOUBLE_EQ(params.read("master_volume")[0], -2.0 / (1 << 23));
}

TEST(ParameterTranslator, FlagWritesLeaveTheOtherBitsAlone) {
    TestRig rig;
    rig.start();
    size_t loaded = rig.context->reloadCatalog(
        "{\"parameters\":["
        "{\"name\":\"bypass\",\"address\":\"0x0021\",\"encoding\":{\"type\":\"bit_flag\",\"bit\":0}},"
        "{\"name\":\"invert\",\"address\":\"0x0021\",\"alias_of\":\"bypass\","
        " \"encoding\":{\"type\":\"bit_flag\",\"bit\":1}}]}");
    ASSERT_EQ(loaded, 2u);
    rig.fake->poke(0x0021, 0x00000101u);
    rig.fake->clearCalls();
    ParameterTranslator& params = rig.context->parameterTranslator();

    params.write("invert", std::vector<double>(1, 1.0));
    EXPECT_EQ(rig.fake->peek(0x0021), 0x00000103u);
    std::vector<FakeTransport::Call> calls = rig.fake->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_FALSE(calls[0].is_write);
    EXPECT_EQ(calls[1].data, ByteBuffer({0x00, 0x00, 0x01, 0x03}));

    params.write("bypass", std::vector<double>(1, 0.0));
    EXPECT_EQ(rig.fake->peek(0x0021), 0x00000102u);
    EXPECT_DOUBLE_EQ(params.read("invert")[0], 1.0);
    EXPECT_DOUBLE_EQ(params.read("bypass")[0], 0.0);
}

TEST(ParameterTranslator, SetVolumeConvertsDecibels) {
    TestRig rig;
    rig.start();
    VolumeOutcome outcome = rig.context->parameterTranslator().setVolumeDb("master_volume", -6.0);
    EXPECT_FALSE(outcome.range_clamped);
    EXPECT_NEAR(outcome.linear, 0.501187, 1e-6);
    EXPECT_NEAR(outcome.db, -6.0, 1e-4);
    EXPECT_EQ(rig.fake->peek(0x0020), encodeValue(dbToLinear(-6.0), ParameterEncoding::fixedPoint(5, 23)).word);
}

TEST(ParameterTranslator, VolumeIsKeptAtOrBelowUnity) {
    TestRig rig;
    rig.start();
    VolumeOutcome outcome = rig.context->parameterTranslator().setVolumeDb("master_volume", 12.0);
    EXPECT_TRUE(outcome.range_clamped);
    EXPECT_DOUBLE_EQ(outcome.linear, 1.0);
    EXPECT_DOUBLE_EQ(outcome.db, 0.0);
    EXPECT_EQ(rig.fake->peek(0x0020), 0x00800000u);
}

TEST(ParameterTranslator, AdjustVolumeStepsFromTheCurrentLevel) {
    TestRig rig;
    rig.start();
    rig.fake->poke(0x0020, 0x00400000u);
    VolumeOutcome outcome = rig.context->parameterTranslator().adjustVolumeDb("master_volume", -6.0);
    EXPECT_NEAR(outcome.db, -12.0206, 1e-3);

    std::vector<FakeTransport::Call> calls = rig.fake->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_FALSE(calls[0].is_write);
    EXPECT_TRUE(calls[1].is_write);
}

TEST(ParameterTranslator, ConcurrentAdjustsAllLand) {
    TestRig rig;
    rig.start();
    rig.fake->poke(0x0020, 0x00800000u);
    rig.fake->setCallDelay(std::chrono::milliseconds(2));

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.push_back(std::thread([&rig]() {
            for (int i = 0; i < 3; ++i) {
                rig.context->parameterTranslator().adjustVolumeDb("master_volume", -1.0);
            }
        }));
    }
    for (std::thread& w : workers) w.join();

    EXPECT_FALSE(rig.fake->overlapDetected());
    double db = linearToDb(rig.context->parameterTranslator().read("master_volume")[0]);
    EXPECT_NEAR(db, -12.0, 1e-3);
    // Every read is followed by its own write before the next read
    std::vector<FakeTransport::Call> calls = rig.fake->calls();
    ASSERT_EQ(calls.size(), 25u);
    for (size_t i = 0; i + 1 < 24; i += 2) {
        EXPECT_FALSE(calls[i].is_write) << i;
        EXPECT_TRUE(calls[i + 1].is_write) << i;
    }
}

TEST(ParameterTranslator, VolumeNeedsAOneWordFixedPointGain) {
    TestRig rig;
    rig.start();
    EXPECT_THROW(rig.context->parameterTranslator().setVolumeDb("mute", -6.0), InvalidRequestError);
    EXPECT_THROW(rig.context->parameterTranslator().setVolumeDb("eq_band1", -6.0), InvalidRequestError);
    EXPECT_THROW(rig.context->parameterTranslator().setVolumeDb("master_volume", std::nan("")),
                 InvalidRequestError);
    EXPECT_TRUE(rig.fake->calls().empty());
}

TEST(ParameterTranslator, ExecuteReportsVolumeResults) {
    TestRig rig;
    rig.start();
    ParameterRequest request = makeRequest(ParameterAction::SET_VOLUME_DB, "master_volume");
    request.db = 0.0;
    ParameterResult result = rig.context->parameterTranslator().execute(request);
    EXPECT_EQ(result.status, ParameterStatus::SUCCESS);
    ASSERT_EQ(result.values.size(), 1u);
    EXPECT_DOUBLE_EQ(result.values[0], 1.0);
    EXPECT_DOUBLE_EQ(result.db, 0.0);
}

TEST(ParameterTranslator, NotReadyBeforeBringUp) {
    TestRig rig;
    rig.context->loadCatalog(kTestCatalog);
    ParameterRequest request = makeRequest(ParameterAction::WRITE, "master_volume");
    request.values.push_back(0.5);
    ParameterResult result = rig.context->parameterTranslator().execute(request);
    EXPECT_EQ(result.status, ParameterStatus::NOT_READY);
    EXPECT_TRUE(rig.fake->calls().empty());
}

TEST(ParameterTranslator, BusFailureIsReportedWithoutRetry) {
    TestRig rig;
    rig.start();
    rig.fake->failNextWrites(1);
    ParameterRequest request = makeRequest(ParameterAction::WRITE, "master_volume");
    request.values.push_back(0.5);
    ParameterResult result = rig.context->parameterTranslator().execute(request);
    EXPECT_EQ(result.status, ParameterStatus::BUS_ERROR);
    EXPECT_TRUE(result.values.empty());
    EXPECT_EQ(rig.fake->writesTo(0x0020), 1u);
}

TEST(DspContext, SoftResetWritesTheResetRegister) {
    TestRig rig;
    rig.start();
    rig.context->softReset();
    std::vector<FakeTransport::Call> calls = rig.fake->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].address, 0xF890);
    EXPECT_EQ(calls[0].data, ByteBuffer({0x00, 0x00}));
    EXPECT_EQ(calls[1].data, ByteBuffer({0x00, 0x01}));
}

TEST(DspContext, HardResetFallsBackToSoftResetWithoutAPin) {
    TestRig rig;
    rig.start();
    rig.context->hardReset();
    EXPECT_EQ(rig.fake->writesTo(0xF890), 2u);
    EXPECT_TRUE(rig.events->empty());
}

TEST(DspContext, HardResetPulsesTheDeclaredPin) {
    TestRig rig(",\"pins\":[{\"purpose\":\"reset\",\"gpio\":17,\"active_high\":false}]");
    rig.start();
    rig.events->clear();
    rig.context->hardReset();
    EXPECT_EQ(rig.events->size(), 2u);
    EXPECT_EQ(rig.fake->writesTo(0xF890), 0u);
    EXPECT_TRUE(rig.context->bus()->isReady());
}

TEST(DspContext, InitialLoadHappensOnceAndStatusReportsIt) {
    TestRig rig;
    rig.start();
    EXPECT_THROW(rig.context->loadCatalog(kTestCatalog), CatalogError);

    DspStatus status = rig.context->status();
    EXPECT_EQ(status.pin_state, PinState::READY);
    EXPECT_EQ(status.transport, "fake");
    EXPECT_EQ(status.parameter_count, 6u);
    EXPECT_EQ(status.catalog_generation, 1u);

    EXPECT_EQ(rig.context->reloadCatalog("{\"parameters\":[]}"), 0u);
    EXPECT_EQ(rig.context->status().catalog_generation, 2u);
}
