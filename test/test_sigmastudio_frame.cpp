#include <gtest/gtest.h>
#include <vector>
#include "../include/sigmastudio_frame.hpp"

namespace {

ByteBuffer sampleStream() {
    ByteBuffer stream;
    ByteBuffer a = encodeWriteRequest(0x0020, ByteBuffer({0x00, 0x40, 0x00, 0x00}), false);
    ByteBuffer b = encodeReadRequest(0x0040, 8);
    ByteBuffer c = encodeWriteRequest(0x0010, ByteBuffer(12, 0xAB), true, 0x01, 2);
    stream.insert(stream.end(), a.begin(), a.end());
    stream.insert(stream.end(), b.begin(), b.end());
    stream.insert(stream.end(), c.begin(), c.end());
    return stream;
}

std::vector<SigmaStudioPacket> drain(SigmaStudioFrameParser& parser) {
    std::vector<SigmaStudioPacket> out;
    SigmaStudioPacket packet;
    while (parser.next(packet)) out.push_back(packet);
    return out;
}

} // namespace

TEST(SigmaStudioFrameParser, DecodesWriteAndReadHeaders) {
    SigmaStudioFrameParser parser(4096);
    ByteBuffer stream = sampleStream();
    ASSERT_TRUE(parser.feed(stream.data(), stream.size()));
    std::vector<SigmaStudioPacket> packets = drain(parser);
    ASSERT_EQ(packets.size(), 3u);

    EXPECT_EQ(packets[0].command, SigmaStudioCommand::WRITE);
    EXPECT_FALSE(packets[0].safeload);
    EXPECT_EQ(packets[0].address, 0x0020);
    EXPECT_EQ(packets[0].total_length, 18u);
    EXPECT_EQ(packets[0].payload, ByteBuffer({0x00, 0x40, 0x00, 0x00}));

    EXPECT_EQ(packets[1].command, SigmaStudioCommand::READ);
    EXPECT_EQ(packets[1].address, 0x0040);
    EXPECT_EQ(packets[1].data_length, 8u);
    EXPECT_EQ(packets[1].chip_address, 0x01);

    EXPECT_TRUE(packets[2].safeload);
    EXPECT_EQ(packets[2].channel, 2);
    EXPECT_EQ(packets[2].payload.size(), 12u);
    EXPECT_EQ(parser.buffered(), 0u);
}

TEST(SigmaStudioFrameParser, SplitPointsDoNotChangeTheResult) {
    ByteBuffer stream = sampleStream();

    SigmaStudioFrameParser whole(4096);
    ASSERT_TRUE(whole.feed(stream.data(), stream.size()));
    std::vector<SigmaStudioPacket> expected = drain(whole);

    SigmaStudioFrameParser trickle(4096);
    for (size_t i = 0; i < stream.size(); ++i) {
        ASSERT_TRUE(trickle.feed(&stream[i], 1));
    }
    std::vector<SigmaStudioPacket> got = drain(trickle);

    ASSERT_EQ(got.size(), expected.size());
    for (size_t i = 0; i < got.size(); ++i) {
        EXPECT_EQ(got[i].command, expected[i].command);
        EXPECT_EQ(got[i].address, expected[i].address);
        EXPECT_EQ(got[i].data_length, expected[i].data_length);
        EXPECT_EQ(got[i].safeload, expected[i].safeload);
        EXPECT_EQ(got[i].payload, expected[i].payload);
    }
}

TEST(SigmaStudioFrameParser, PartialPayloadWaitsForTheRest) {
    ByteBuffer frame = encodeWriteRequest(0x0020, ByteBuffer(8, 0x11), false);
    SigmaStudioFrameParser parser(4096);
    ASSERT_TRUE(parser.feed(frame.data(), frame.size() - 3));
    SigmaStudioPacket packet;
    EXPECT_FALSE(parser.next(packet));
    ASSERT_TRUE(parser.feed(frame.data() + frame.size() - 3, 3));
    EXPECT_TRUE(parser.next(packet));
    EXPECT_EQ(packet.payload.size(), 8u);
}

TEST(SigmaStudioFrameParser, UnknownCommandHeaderIsSkipped) {
    ByteBuffer stream(kSigmaStudioHeaderLength, 0);
    stream[0] = 0x7F;
    ByteBuffer read = encodeReadRequest(0x0030, 4);
    stream.insert(stream.end(), read.begin(), read.end());

    SigmaStudioFrameParser parser(4096);
    ASSERT_TRUE(parser.feed(stream.data(), stream.size()));
    std::vector<SigmaStudioPacket> packets = drain(parser);
    ASSERT_EQ(packets.size(), 1u);
    EXPECT_EQ(packets[0].address, 0x0030);
    EXPECT_EQ(parser.unknownCommands(), 1u);
}

TEST(SigmaStudioFrameParser, OversizedPayloadFailsTheStream) {
    ByteBuffer frame = encodeWriteRequest(0x0020, ByteBuffer(20, 0), false);
    SigmaStudioFrameParser parser(16);
    EXPECT_FALSE(parser.feed(frame.data(), frame.size()));
    EXPECT_TRUE(parser.failed());
    EXPECT_EQ(parser.buffered(), 0u);

    ByteBuffer read = encodeReadRequest(0x0020, 4);
    EXPECT_FALSE(parser.feed(read.data(), read.size()));

    parser.reset();
    EXPECT_TRUE(parser.feed(read.data(), read.size()));
}

TEST(SigmaStudioFrame, ReadResponseLayout) {
    ByteBuffer frame = encodeReadResponse(0x01, 0x0123, ByteBuffer({0xDE, 0xAD, 0xBE, 0xEF}), true);
    ByteBuffer expected = {0x0B, 0x00, 0x00, 0x00, 0x12, 0x01, 0x00, 0x00, 0x00, 0x04,
                           0x01, 0x23, 0x00, 0x00, 0xDE, 0xAD, 0xBE, 0xEF};
    EXPECT_EQ(frame, expected);

    ByteBuffer failed = encodeReadResponse(0x01, 0x0123, ByteBuffer(2, 0), false);
    ASSERT_EQ(failed.size(), 16u);
    EXPECT_EQ(failed[12], 1);
}
