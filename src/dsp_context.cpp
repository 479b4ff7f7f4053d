#include "../include/dsp_context.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <utility>

DspContext::DspContext(const ConfigManager& config, std::unique_ptr<BusTransport> transport,
                       std::unique_ptr<GpioDriver> gpio)
    : chip_(config.getChipConfig()) {
    pins_ = std::make_shared<PinController>(std::move(gpio), config.getPinConfig(), chip_.reset_hold_ms,
                                            chip_.boot_delay_ms);
    bus_ = std::make_shared<DspBus>(std::move(transport), pins_, chip_, config.getBusConfig().timeout_ms);
    safeload_ = std::make_shared<SafeloadEngine>(bus_, config.getSafeloadLayout());
    catalogs_ = std::make_shared<ParameterCatalogStore>();
    address_translator_.reset(new AddressTranslator(bus_, safeload_));
    parameter_translator_.reset(new ParameterTranslator(bus_, safeload_, catalogs_));
}

DspContext::~DspContext() {}

void DspContext::bringUp() {
    bus_->bringUp();
}

size_t DspContext::loadCatalog(const std::string& json) {
    if (catalogs_->loaded()) {
        throw CatalogError("catalog already loaded, use a reload instead");
    }
    std::shared_ptr<const ParameterCatalog> catalog = ParameterCatalog::fromJson(json, chip_.address_space);
    catalogs_->replace(catalog);
    return catalog->size();
}

size_t DspContext::reloadCatalog(const std::string& json) {
    return catalogs_->reloadFromJson(json, chip_.address_space);
}

void DspContext::hardReset() {
    if (!pins_->hasResetPin()) {
        Logger::info("[DSP] No reset pin defined, falling back to a soft reset");
        softReset();
        return;
    }
    bus_->hardReset();
}

void DspContext::softReset() {
    if (!chip_.has_soft_reset) {
        throw InvalidRequestError("this chip has no soft-reset register configured");
    }
    Logger::info("[DSP] Soft-resetting the DSP");
    DspBus::Session session = bus_->acquire();
    ByteBuffer assert_reset(2, 0x00);
    ByteBuffer release_reset(2, 0x00);
    release_reset[1] = 0x01;
    session.write(chip_.soft_reset_address, assert_reset);
    session.write(chip_.soft_reset_address, release_reset);
}

void DspContext::setSelfBoot(bool enabled) {
    bus_->setSelfBoot(enabled);
}

DspStatus DspContext::status() const {
    DspStatus s;
    s.pin_state = pins_->state();
    s.self_boot = pins_->selfBootEnabled();
    s.transport = bus_->transportName();
    s.bus = bus_->statistics();
    s.safeload_commits = safeload_->commitCount();
    if (catalogs_->loaded()) {
        s.parameter_count = catalogs_->current()->size();
    }
    s.catalog_generation = catalogs_->generation();
    return s;
}
