#include "../include/address_translator.hpp"
#include "../include/logger.hpp"
#include <utility>

AddressTranslator::AddressTranslator(std::shared_ptr<DspBus> bus, std::shared_ptr<SafeloadEngine> safeload)
    : bus_(std::move(bus)), safeload_(std::move(safeload)) {
}

AddressTranslator::~AddressTranslator() {}

void AddressTranslator::write(const AddressWriteRequest& request) {
    const size_t word_size = bus_->wordSize();
    if (request.data.empty()) {
        throw InvalidRequestError("write without payload");
    }

    if (request.data.size() <= word_size) {
        bus_->write(request.address, request.data);
        return;
    }

    const bool whole_words = request.data.size() % word_size == 0;
    const size_t words = request.data.size() / word_size;

    if (request.safeload) {
        if (word_size > kRegisterWordBytes) {
            throw InvalidRequestError("safeload slots hold " + std::to_string(kRegisterWordBytes) +
                                      "-byte words, not " + std::to_string(word_size));
        }
        if (!whole_words) {
            throw InvalidRequestError("safeload of " + std::to_string(request.data.size()) +
                                      " bytes is not a whole number of " + std::to_string(word_size) +
                                      "-byte words");
        }
        SafeloadTransaction txn;
        for (size_t i = 0; i < words; ++i) {
            RegisterWord word = 0;
            for (size_t b = 0; b < word_size; ++b) {
                word = (word << 8) | request.data[i * word_size + b];
            }
            txn.add((BusAddress)(request.address + i), word);
        }
        safeload_->commit(txn);
        return;
    }

    // Program and other odd-length blocks go to the chip as sent
    if (!whole_words) {
        bus_->write(request.address, request.data);
        return;
    }

    // Sequential writes in the order SigmaStudio sent them
    for (size_t i = 0; i < words; ++i) {
        ByteBuffer chunk(request.data.begin() + i * word_size, request.data.begin() + (i + 1) * word_size);
        bus_->write((BusAddress)(request.address + i), chunk);
    }
}

AddressReadResponse AddressTranslator::read(const AddressReadRequest& request) {
    AddressReadResponse response;
    try {
        response.data = bus_->read(request.address, request.length);
        response.success = true;
    } catch (const DspException& e) {
        Logger::warn("[SigmaTCP] Read of %u bytes at 0x%04X failed: %s", (unsigned)request.length,
                     request.address, e.what());
        response.success = false;
        response.error = e.code();
        response.data.assign(request.length, 0);
    }
    return response;
}

ByteBuffer AddressTranslator::handle(const SigmaStudioPacket& packet) {
    if (packet.command == SigmaStudioCommand::READ) {
        AddressReadRequest request;
        request.address = packet.address;
        request.length = packet.data_length;
        AddressReadResponse response = read(request);
        return encodeReadResponse(packet.chip_address, packet.address, response.data, response.success);
    }

    AddressWriteRequest request;
    request.address = packet.address;
    request.data = packet.payload;
    request.safeload = packet.safeload;
    Logger::debug("[SigmaTCP] %s %u bytes to 0x%04X", packet.safeload ? "Safeload" : "Write",
                  (unsigned)packet.payload.size(), packet.address);
    try {
        write(request);
    } catch (const DspException& e) {
        // The protocol has no write acknowledgement to carry the error
        failed_writes_++;
        Logger::error("[SigmaTCP] Write of %u bytes at 0x%04X failed (%s): %s", (unsigned)packet.payload.size(),
                      packet.address, errorCodeToString(e.code()), e.what());
    }
    return ByteBuffer();
}
