#pragma once
#include <stdint.h>
#include <atomic>
#include <memory>
#include <vector>
#include "config_manager.hpp"

// Output-only GPIO access; the firmware backs this with pinMode/digitalWrite.
class GpioDriver {
public:
    virtual ~GpioDriver() {}
    virtual void configureOutput(int gpio, bool level) = 0;
    virtual void writeLevel(int gpio, bool level) = 0;
};

enum class PinState {
    UNINITIALIZED,
    RESET_ASSERTED,
    READY
};

inline const char* pinStateToString(PinState state) {
    switch (state) {
        case PinState::UNINITIALIZED: return "uninitialized";
        case PinState::RESET_ASSERTED: return "reset_asserted";
        case PinState::READY: return "ready";
        default: return "unknown";
    }
}

// Drives the DSP's reset and self-boot lines. The chip may only be
// addressed on the bus once the controller reports READY.
class PinController {
public:
    PinController(std::unique_ptr<GpioDriver> gpio, const std::vector<PinDescriptor>& pins,
                  uint32_t reset_hold_ms, uint32_t boot_delay_ms);
    ~PinController();

    // Startup sequence. Runs exactly once; a second call throws.
    void begin();

    // Operator-requested reset pulse. Only valid once READY.
    void hardReset();

    // Forced-reprogramming escape hatch; not used in normal request handling.
    void setSelfBoot(bool enabled);

    bool hasResetPin() const;
    bool hasSelfBootPin() const;
    bool selfBootEnabled() const;
    PinState state() const;
    bool isReady() const;

private:
    std::unique_ptr<GpioDriver> gpio_;
    std::vector<PinDescriptor> pins_;
    uint32_t reset_hold_ms_;
    uint32_t boot_delay_ms_;
    std::atomic<PinState> state_;
    std::atomic<bool> self_boot_;

    const PinDescriptor* findPin(PinPurpose purpose) const;
    void driveLogical(const PinDescriptor& pin, bool active);
    void pulseReset(const PinDescriptor& reset_pin);
};
