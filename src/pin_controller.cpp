#include "../include/pin_controller.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <chrono>
#include <thread>
#include <utility>

static void sleepMs(uint32_t ms) {
    if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

PinController::PinController(std::unique_ptr<GpioDriver> gpio, const std::vector<PinDescriptor>& pins,
                             uint32_t reset_hold_ms, uint32_t boot_delay_ms)
    : gpio_(std::move(gpio)), pins_(pins), reset_hold_ms_(reset_hold_ms),
      boot_delay_ms_(boot_delay_ms), state_(PinState::UNINITIALIZED), self_boot_(false) {
}

PinController::~PinController() {}

const PinDescriptor* PinController::findPin(PinPurpose purpose) const {
    for (const auto& pin : pins_) {
        if (pin.purpose == purpose) return &pin;
    }
    return nullptr;
}

void PinController::driveLogical(const PinDescriptor& pin, bool active) {
    bool level = pin.active_high ? active : !active;
    gpio_->writeLevel(pin.gpio, level);
}

void PinController::pulseReset(const PinDescriptor& reset_pin) {
    state_ = PinState::RESET_ASSERTED;
    driveLogical(reset_pin, true);
    sleepMs(reset_hold_ms_);
    driveLogical(reset_pin, false);
    sleepMs(boot_delay_ms_);
}

void PinController::begin() {
    if (state_ != PinState::UNINITIALIZED) {
        throw InvalidRequestError("pin controller already started");
    }

    for (const auto& pin : pins_) {
        bool level = pin.active_high ? pin.initial_state : !pin.initial_state;
        gpio_->configureOutput(pin.gpio, level);
        if (pin.purpose == PinPurpose::SELF_BOOT) {
            self_boot_ = pin.initial_state;
        }
        Logger::info("[Pins] %s pin on GPIO %d (active %s, initial %s)", pinPurposeToString(pin.purpose),
                     pin.gpio, pin.active_high ? "high" : "low", pin.initial_state ? "on" : "off");
    }

    const PinDescriptor* reset_pin = findPin(PinPurpose::RESET);
    if (reset_pin) {
        Logger::info("[Pins] Hard-resetting the DSP");
        pulseReset(*reset_pin);
    } else {
        Logger::info("[Pins] No reset pin defined, skipping hard reset");
        sleepMs(boot_delay_ms_);
    }

    state_ = PinState::READY;
    Logger::info("[Pins] DSP ready");
}

void PinController::hardReset() {
    if (state_ != PinState::READY) {
        throw NotReadyError("hard reset requested before the DSP finished booting");
    }
    const PinDescriptor* reset_pin = findPin(PinPurpose::RESET);
    if (!reset_pin) {
        throw InvalidRequestError("no reset pin is configured");
    }
    Logger::info("[Pins] Hard-resetting the DSP on request");
    pulseReset(*reset_pin);
    state_ = PinState::READY;
}

void PinController::setSelfBoot(bool enabled) {
    const PinDescriptor* pin = findPin(PinPurpose::SELF_BOOT);
    if (!pin) {
        throw InvalidRequestError("no self_boot pin is configured");
    }
    if (state_ == PinState::UNINITIALIZED) {
        throw NotReadyError("pins are not configured yet");
    }
    driveLogical(*pin, enabled);
    self_boot_ = enabled;
    Logger::warn("[Pins] Self-boot line forced %s", enabled ? "on" : "off");
}

bool PinController::hasResetPin() const { return findPin(PinPurpose::RESET) != nullptr; }
bool PinController::hasSelfBootPin() const { return findPin(PinPurpose::SELF_BOOT) != nullptr; }
bool PinController::selfBootEnabled() const { return self_boot_; }
PinState PinController::state() const { return state_; }
bool PinController::isReady() const { return state_ == PinState::READY; }
