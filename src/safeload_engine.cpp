#include "../include/safeload_engine.hpp"
#include "../include/exceptions.hpp"
#include "../include/fixed_point_codec.hpp"
#include "../include/logger.hpp"
#include <chrono>
#include <thread>
#include <utility>

static ByteBuffer be16(uint16_t value) {
    ByteBuffer out;
    out.push_back((uint8_t)(value >> 8));
    out.push_back((uint8_t)(value & 0xFF));
    return out;
}

void SafeloadTransaction::add(BusAddress address, RegisterWord word) {
    if (committed_) {
        throw InvalidRequestError("safeload transaction already committed");
    }
    RegisterWrite entry;
    entry.address = address;
    entry.word = word;
    entries_.push_back(entry);
}

SafeloadEngine::SafeloadEngine(std::shared_ptr<DspBus> bus, const SafeloadLayout& layout)
    : bus_(std::move(bus)), layout_(layout), commits_(0) {
}

SafeloadEngine::~SafeloadEngine() {}

void SafeloadEngine::validate(const SafeloadTransaction& txn) const {
    if (txn.committed_) {
        throw InvalidRequestError("safeload transaction already committed");
    }
    if (txn.empty()) {
        throw InvalidRequestError("empty safeload transaction");
    }
    if (txn.size() > layout_.slot_count) {
        throw TransactionTooLargeError("safeload of " + std::to_string(txn.size()) + " words exceeds the " +
                                       std::to_string(layout_.slot_count) + " hardware slots");
    }
}

void SafeloadEngine::commit(SafeloadTransaction& txn) {
    validate(txn);
    txn.committed_ = true;

    DspBus::Session session = bus_->acquire();

    for (size_t slot = 0; slot < txn.entries_.size(); ++slot) {
        const RegisterWrite& entry = txn.entries_[slot];
        session.write((BusAddress)(layout_.data_slot_base + slot), packWords(std::vector<RegisterWord>(1, entry.word)));
        session.write((BusAddress)(layout_.address_slot_base + slot), be16(entry.address));
        Logger::debug("[SafeLoad] Slot %u: 0x%04X <- 0x%08X", (unsigned)slot, entry.address, entry.word);
    }
    session.write(layout_.pending_count_address, be16((uint16_t)txn.size()));

    // Set the trigger without disturbing the rest of the core control register
    ByteBuffer control = session.read(layout_.core_control_address, 2);
    uint16_t value = (uint16_t)((control[0] << 8) | control[1]);
    value |= layout_.commit_trigger_mask;
    session.write(layout_.core_control_address, be16(value));

    if (layout_.settle_us > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(layout_.settle_us));
    }

    commits_++;
    Logger::info("[SafeLoad] Committed %u word(s) starting at 0x%04X", (unsigned)txn.size(),
                 txn.entries_.front().address);
}
