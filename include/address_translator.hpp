#pragma once
#include <stdint.h>
#include <atomic>
#include <memory>
#include "dsp_bus.hpp"
#include "exceptions.hpp"
#include "safeload_engine.hpp"
#include "sigmastudio_frame.hpp"
#include "types.hpp"

struct AddressWriteRequest {
    BusAddress address = 0;
    ByteBuffer data;
    bool safeload = false;          // atomicity comes from the framing, never from the length
};

struct AddressReadRequest {
    BusAddress address = 0;
    uint32_t length = 0;
};

struct AddressReadResponse {
    bool success = false;
    ByteBuffer data;                // zero-filled to the requested length on failure
    ErrorCode error = ERR_NONE;
};

// Raw register access for the SigmaStudio protocol.
class AddressTranslator {
public:
    AddressTranslator(std::shared_ptr<DspBus> bus, std::shared_ptr<SafeloadEngine> safeload);
    ~AddressTranslator();

    // Throws DspException subclasses. A whole-word write without the
    // safeload flag is issued word by word in the requested order; any
    // other length goes out as one transfer.
    void write(const AddressWriteRequest& request);

    AddressReadResponse read(const AddressReadRequest& request);

    // Runs one parsed packet and returns the bytes to send back (none for writes).
    ByteBuffer handle(const SigmaStudioPacket& packet);

    uint32_t failedWrites() const { return failed_writes_; }

private:
    std::shared_ptr<DspBus> bus_;
    std::shared_ptr<SafeloadEngine> safeload_;
    std::atomic<uint32_t> failed_writes_{0};
};
