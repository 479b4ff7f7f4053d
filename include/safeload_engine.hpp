#pragma once
#include <stdint.h>
#include <atomic>
#include <memory>
#include <vector>
#include "config_manager.hpp"
#include "dsp_bus.hpp"
#include "types.hpp"

// Ordered (address, word) pairs to be applied in one atomic step.
// Built incrementally and committed exactly once.
class SafeloadTransaction {
public:
    void add(BusAddress address, RegisterWord word);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    bool committed() const { return committed_; }
    const std::vector<RegisterWrite>& entries() const { return entries_; }

private:
    friend class SafeloadEngine;
    std::vector<RegisterWrite> entries_;
    bool committed_ = false;
};

// Drives the chip's safeload slots so that every parameter in a
// transaction becomes visible to the audio core in the same sample.
class SafeloadEngine {
public:
    SafeloadEngine(std::shared_ptr<DspBus> bus, const SafeloadLayout& layout);
    ~SafeloadEngine();

    // Loads the slots, sets the trigger and waits for the core to pick it up,
    // all under one bus session. Size and state checks happen before any write.
    void commit(SafeloadTransaction& txn);

    size_t slotCount() const { return layout_.slot_count; }
    uint32_t commitCount() const { return commits_; }

private:
    std::shared_ptr<DspBus> bus_;
    SafeloadLayout layout_;
    std::atomic<uint32_t> commits_;

    void validate(const SafeloadTransaction& txn) const;
};
