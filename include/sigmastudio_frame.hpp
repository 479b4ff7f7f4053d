#pragma once
#include <stdint.h>
#include <deque>
#include "types.hpp"

// SigmaStudio TCP register protocol. Every packet starts with a 14-byte
// header; multi-byte fields are big-endian.
//
// Write request:  [0] 0x09  [1] safeload  [2] channel  [3..6] total length
//                 [7] chip address  [8..11] payload length  [12..13] address
// Read request:   [0] 0x0A  [1..4] total length  [5] chip address
//                 [6..9] data length  [10..11] address  [12..13] reserved
// Read response:  [0] 0x0B  [1..4] total length  [5] chip address
//                 [6..9] data length  [10..11] address  [12] 0 ok / 1 failed
//                 [13] reserved, followed by the data
const size_t kSigmaStudioHeaderLength = 14;

enum class SigmaStudioCommand : uint8_t {
    WRITE = 0x09,
    READ = 0x0A,
    READ_RESPONSE = 0x0B
};

struct SigmaStudioPacket {
    SigmaStudioCommand command = SigmaStudioCommand::WRITE;
    bool safeload = false;
    uint8_t channel = 0;
    uint32_t total_length = 0;
    uint8_t chip_address = 0;       // as sent, R/W flag in bit 0
    uint32_t data_length = 0;
    BusAddress address = 0;
    ByteBuffer payload;             // WRITE only
};

ByteBuffer encodeReadResponse(uint8_t chip_address, BusAddress address, const ByteBuffer& data, bool success);

// Request encoders, as SigmaStudio itself would frame them.
ByteBuffer encodeWriteRequest(BusAddress address, const ByteBuffer& payload, bool safeload,
                              uint8_t chip_address = 0x01, uint8_t channel = 0);
ByteBuffer encodeReadRequest(BusAddress address, uint32_t length, uint8_t chip_address = 0x01);

// Reassembles packets from a TCP byte stream regardless of how it is split.
class SigmaStudioFrameParser {
public:
    explicit SigmaStudioFrameParser(uint32_t max_payload_bytes);

    // Returns false once a packet declares a payload beyond the limit; the
    // stream cannot be resynchronised after that and should be closed.
    bool feed(const uint8_t* data, size_t length);

    // Pops the oldest complete packet.
    bool next(SigmaStudioPacket& out);

    bool failed() const { return failed_; }
    uint32_t unknownCommands() const { return unknown_commands_; }
    size_t buffered() const { return buffer_.size(); }
    void reset();

private:
    uint32_t max_payload_bytes_;
    ByteBuffer buffer_;
    std::deque<SigmaStudioPacket> ready_;
    bool failed_ = false;
    uint32_t unknown_commands_ = 0;

    void extract();
};
