#pragma once
#include <stdint.h>
#include <memory>
#include <string>
#include "address_translator.hpp"
#include "bus_transport.hpp"
#include "config_manager.hpp"
#include "dsp_bus.hpp"
#include "parameter_catalog.hpp"
#include "parameter_translator.hpp"
#include "pin_controller.hpp"
#include "safeload_engine.hpp"

struct DspStatus {
    PinState pin_state = PinState::UNINITIALIZED;
    bool self_boot = false;
    std::string transport;
    BusStatistics bus;
    uint32_t safeload_commits = 0;
    size_t parameter_count = 0;
    uint32_t catalog_generation = 0;
};

// Process-wide chip state: pins, bus, safeload engine, catalog and both
// translators. Created once at startup and handed to the listeners.
class DspContext {
public:
    DspContext(const ConfigManager& config, std::unique_ptr<BusTransport> transport,
               std::unique_ptr<GpioDriver> gpio);
    ~DspContext();

    // Pin startup sequence followed by transport bring-up. Runs once.
    void bringUp();

    // Initial catalog load; a CatalogError here must stop the bridge.
    size_t loadCatalog(const std::string& json);
    // Replaces the catalog only if the new table validates.
    size_t reloadCatalog(const std::string& json);

    // Pulses the reset line, or falls back to a soft reset when no reset pin exists.
    void hardReset();
    void softReset();
    void setSelfBoot(bool enabled);

    DspStatus status() const;

    std::shared_ptr<DspBus> bus() const { return bus_; }
    std::shared_ptr<ParameterCatalogStore> catalogs() const { return catalogs_; }
    AddressTranslator& addressTranslator() { return *address_translator_; }
    ParameterTranslator& parameterTranslator() { return *parameter_translator_; }

private:
    ChipConfig chip_;
    std::shared_ptr<PinController> pins_;
    std::shared_ptr<DspBus> bus_;
    std::shared_ptr<SafeloadEngine> safeload_;
    std::shared_ptr<ParameterCatalogStore> catalogs_;
    std::unique_ptr<AddressTranslator> address_translator_;
    std::unique_ptr<ParameterTranslator> parameter_translator_;
};
