#include "../include/sigmastudio_frame.hpp"
#include "../include/logger.hpp"

static uint32_t readBe32(const uint8_t* p) {
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

static uint16_t readBe16(const uint8_t* p) {
    return (uint16_t)(((uint16_t)p[0] << 8) | p[1]);
}

static void putBe32(ByteBuffer& out, size_t offset, uint32_t value) {
    out[offset] = (uint8_t)(value >> 24);
    out[offset + 1] = (uint8_t)(value >> 16);
    out[offset + 2] = (uint8_t)(value >> 8);
    out[offset + 3] = (uint8_t)value;
}

static void putBe16(ByteBuffer& out, size_t offset, uint16_t value) {
    out[offset] = (uint8_t)(value >> 8);
    out[offset + 1] = (uint8_t)value;
}

ByteBuffer encodeReadResponse(uint8_t chip_address, BusAddress address, const ByteBuffer& data, bool success) {
    ByteBuffer frame(kSigmaStudioHeaderLength, 0);
    frame[0] = (uint8_t)SigmaStudioCommand::READ_RESPONSE;
    putBe32(frame, 1, (uint32_t)(kSigmaStudioHeaderLength + data.size()));
    frame[5] = chip_address;
    putBe32(frame, 6, (uint32_t)data.size());
    putBe16(frame, 10, address);
    frame[12] = success ? 0 : 1;
    frame[13] = 0;
    frame.insert(frame.end(), data.begin(), data.end());
    return frame;
}

ByteBuffer encodeWriteRequest(BusAddress address, const ByteBuffer& payload, bool safeload,
                              uint8_t chip_address, uint8_t channel) {
    ByteBuffer frame(kSigmaStudioHeaderLength, 0);
    frame[0] = (uint8_t)SigmaStudioCommand::WRITE;
    frame[1] = safeload ? 1 : 0;
    frame[2] = channel;
    putBe32(frame, 3, (uint32_t)(kSigmaStudioHeaderLength + payload.size()));
    frame[7] = chip_address;
    putBe32(frame, 8, (uint32_t)payload.size());
    putBe16(frame, 12, address);
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

ByteBuffer encodeReadRequest(BusAddress address, uint32_t length, uint8_t chip_address) {
    ByteBuffer frame(kSigmaStudioHeaderLength, 0);
    frame[0] = (uint8_t)SigmaStudioCommand::READ;
    putBe32(frame, 1, (uint32_t)kSigmaStudioHeaderLength);
    frame[5] = chip_address;
    putBe32(frame, 6, length);
    putBe16(frame, 10, address);
    return frame;
}

SigmaStudioFrameParser::SigmaStudioFrameParser(uint32_t max_payload_bytes)
    : max_payload_bytes_(max_payload_bytes) {
}

bool SigmaStudioFrameParser::feed(const uint8_t* data, size_t length) {
    if (failed_) return false;
    buffer_.insert(buffer_.end(), data, data + length);
    extract();
    return !failed_;
}

bool SigmaStudioFrameParser::next(SigmaStudioPacket& out) {
    if (ready_.empty()) return false;
    out = ready_.front();
    ready_.pop_front();
    return true;
}

void SigmaStudioFrameParser::reset() {
    buffer_.clear();
    ready_.clear();
    failed_ = false;
    unknown_commands_ = 0;
}

void SigmaStudioFrameParser::extract() {
    size_t pos = 0;
    while (buffer_.size() - pos >= kSigmaStudioHeaderLength) {
        const uint8_t* h = buffer_.data() + pos;
        SigmaStudioPacket packet;

        if (h[0] == (uint8_t)SigmaStudioCommand::WRITE) {
            packet.command = SigmaStudioCommand::WRITE;
            packet.safeload = h[1] == 1;
            packet.channel = h[2];
            packet.total_length = readBe32(h + 3);
            packet.chip_address = h[7];
            packet.data_length = readBe32(h + 8);
            packet.address = readBe16(h + 12);
            if (packet.data_length > max_payload_bytes_) {
                Logger::error("[SigmaTCP] Write of %u bytes exceeds the %u byte limit, dropping stream",
                              (unsigned)packet.data_length, (unsigned)max_payload_bytes_);
                failed_ = true;
                buffer_.clear();
                return;
            }
            if (buffer_.size() - pos < kSigmaStudioHeaderLength + packet.data_length) break;
            const uint8_t* body = h + kSigmaStudioHeaderLength;
            packet.payload.assign(body, body + packet.data_length);
            pos += kSigmaStudioHeaderLength + packet.data_length;
        } else if (h[0] == (uint8_t)SigmaStudioCommand::READ) {
            packet.command = SigmaStudioCommand::READ;
            packet.total_length = readBe32(h + 1);
            packet.chip_address = h[5];
            packet.data_length = readBe32(h + 6);
            packet.address = readBe16(h + 10);
            if (packet.data_length > max_payload_bytes_) {
                Logger::error("[SigmaTCP] Read of %u bytes exceeds the %u byte limit, dropping stream",
                              (unsigned)packet.data_length, (unsigned)max_payload_bytes_);
                failed_ = true;
                buffer_.clear();
                return;
            }
            pos += kSigmaStudioHeaderLength;
        } else {
            Logger::info("[SigmaTCP] Unknown command code 0x%02X, header discarded", h[0]);
            unknown_commands_++;
            pos += kSigmaStudioHeaderLength;
            continue;
        }
        ready_.push_back(packet);
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + pos);
}
