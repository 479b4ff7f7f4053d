#include "../include/config_manager.hpp"
#include "../include/exceptions.hpp"
#include "../include/json_fields.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <string>

namespace {

std::string keyPath(const char* section, const char* key) {
    return std::string(section) + "." + key;
}

uint32_t readUnsigned(JsonObjectConst obj, const char* section, const char* key,
                      uint32_t fallback, uint32_t max_value) {
    JsonVariantConst v = obj[key];
    if (v.isNull()) return fallback;
    uint32_t out = 0;
    if (!jsonToUnsigned(v, out) || out > max_value) {
        throw ConfigError(keyPath(section, key) + ": expected an unsigned integer <= " +
                          std::to_string(max_value));
    }
    return out;
}

bool readBool(JsonObjectConst obj, const char* section, const char* key, bool fallback) {
    JsonVariantConst v = obj[key];
    if (v.isNull()) return fallback;
    if (!v.is<bool>()) {
        throw ConfigError(keyPath(section, key) + ": expected true or false");
    }
    return v.as<bool>();
}

std::string readString(JsonObjectConst obj, const char* section, const char* key,
                       const std::string& fallback) {
    JsonVariantConst v = obj[key];
    if (v.isNull()) return fallback;
    if (!v.is<const char*>()) {
        throw ConfigError(keyPath(section, key) + ": expected a string");
    }
    return std::string(v.as<const char*>());
}

JsonObjectConst section(JsonObjectConst parent, const char* name) {
    JsonVariantConst v = parent[name];
    if (!v.isNull() && !v.is<JsonObjectConst>()) {
        throw ConfigError(std::string(name) + ": expected an object");
    }
    return v.as<JsonObjectConst>();
}

} // namespace

ConfigManager::ConfigManager() {
    initializeDefaults();
}

ConfigManager::~ConfigManager() {}

void ConfigManager::initializeDefaults() {
    device_id_ = "sigmadsp-bridge";

    wifi_config_.ssid = "";
    wifi_config_.password = "";

    // VSPI with its default chip select on the ESP32
    bus_config_.kind = BusKind::SPI;
    bus_config_.bus_number = 3;
    bus_config_.device_address = 0;
    bus_config_.clock_hz = 1000000;
    bus_config_.cs_gpio = 5;
    bus_config_.sda_gpio = 21;
    bus_config_.scl_gpio = 22;
    bus_config_.transfer_granularity = 1;
    bus_config_.timeout_ms = 100;
    bus_config_.max_transfer_bytes = 4096;

    // No pins declared means no hard reset is available
    pin_configs_.clear();

    chip_config_.word_size = kRegisterWordBytes;
    chip_config_.address_space = 0x10000;
    chip_config_.has_soft_reset = false;
    chip_config_.soft_reset_address = 0xF890;
    chip_config_.reset_hold_ms = 10;
    chip_config_.boot_delay_ms = 50;

    // ADAU1701 safeload block
    safeload_layout_.data_slot_base = 0x0810;
    safeload_layout_.address_slot_base = 0x0815;
    safeload_layout_.pending_count_address = 0x081B;
    safeload_layout_.core_control_address = 0x081C;
    safeload_layout_.commit_trigger_mask = 0x0020;
    safeload_layout_.slot_count = 5;
    safeload_layout_.settle_us = 50;

    catalog_config_.path = "/config/parameters.json";

    network_config_.tcp_host = "0.0.0.0";
    network_config_.tcp_port = 8087;
    network_config_.rpc_port = 50051;

    logging_config_.log_level = "INFO";
    logging_config_.flush_on_write = true;
}

void ConfigManager::loadFromJson(const std::string& json) {
    DynamicJsonDocument doc(8192);
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        throw ConfigError(std::string("configuration is not valid JSON: ") + error.c_str());
    }
    if (!doc.is<JsonObject>()) {
        throw ConfigError("configuration root must be an object");
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();

    // Parse into copies so a rejected document leaves the current settings intact
    std::string device_id = readString(root, "root", "device_id", device_id_);
    WifiConfig wifi = wifi_config_;
    BusConfig bus = bus_config_;
    std::vector<PinDescriptor> pins = pin_configs_;
    ChipConfig chip = chip_config_;
    SafeloadLayout safeload = safeload_layout_;
    CatalogConfig catalog = catalog_config_;
    NetworkConfig network = network_config_;
    LoggingConfig logging = logging_config_;

    JsonObjectConst wifi_obj = section(root, "wifi");
    if (!wifi_obj.isNull()) {
        wifi.ssid = readString(wifi_obj, "wifi", "ssid", wifi.ssid);
        wifi.password = readString(wifi_obj, "wifi", "password", wifi.password);
    }

    JsonObjectConst dsp = section(root, "dsp");
    if (!dsp.isNull()) {
        JsonObjectConst bus_obj = section(dsp, "bus");
        if (!bus_obj.isNull()) {
            std::string kind = readString(bus_obj, "dsp.bus", "kind", busKindToString(bus.kind));
            if (kind == "spi") {
                bus.kind = BusKind::SPI;
            } else if (kind == "i2c") {
                bus.kind = BusKind::I2C;
            } else {
                throw ConfigError("dsp.bus.kind: unknown bus kind '" + kind + "' (expected spi or i2c)");
            }
            bus.bus_number = (uint8_t)readUnsigned(bus_obj, "dsp.bus", "bus_number", bus.bus_number, 0xFF);
            bus.device_address = (uint8_t)readUnsigned(bus_obj, "dsp.bus", "device_address", bus.device_address, 0xFF);
            bus.clock_hz = readUnsigned(bus_obj, "dsp.bus", "clock_hz", bus.clock_hz, 80000000);
            bus.cs_gpio = (int)readUnsigned(bus_obj, "dsp.bus", "cs_gpio", (uint32_t)bus.cs_gpio, 48);
            bus.sda_gpio = (int)readUnsigned(bus_obj, "dsp.bus", "sda_gpio", (uint32_t)bus.sda_gpio, 48);
            bus.scl_gpio = (int)readUnsigned(bus_obj, "dsp.bus", "scl_gpio", (uint32_t)bus.scl_gpio, 48);
            bus.transfer_granularity = (uint8_t)readUnsigned(bus_obj, "dsp.bus", "transfer_granularity",
                                                             bus.transfer_granularity, 8);
            bus.timeout_ms = readUnsigned(bus_obj, "dsp.bus", "timeout_ms", bus.timeout_ms, 60000);
            bus.max_transfer_bytes = readUnsigned(bus_obj, "dsp.bus", "max_transfer_bytes",
                                                  bus.max_transfer_bytes, 0x100000);
            if (bus.transfer_granularity == 0) {
                throw ConfigError("dsp.bus.transfer_granularity: must be at least 1");
            }
            if (bus.timeout_ms == 0) {
                throw ConfigError("dsp.bus.timeout_ms: must be at least 1");
            }
            if (bus.max_transfer_bytes < kRegisterWordBytes) {
                throw ConfigError("dsp.bus.max_transfer_bytes: must hold at least one register word");
            }
            if (bus.kind == BusKind::I2C && bus.device_address > 0x7F) {
                throw ConfigError("dsp.bus.device_address: I2C addresses are 7-bit");
            }
        }

        JsonVariantConst pins_var = dsp["pins"];
        if (!pins_var.isNull()) {
            if (!pins_var.is<JsonArrayConst>()) {
                throw ConfigError("dsp.pins: expected an array");
            }
            pins.clear();
            size_t index = 0;
            for (JsonVariantConst pin_var : pins_var.as<JsonArrayConst>()) {
                std::string where = "dsp.pins[" + std::to_string(index++) + "]";
                if (!pin_var.is<JsonObjectConst>()) {
                    throw ConfigError(where + ": expected an object");
                }
                JsonObjectConst pin_obj = pin_var.as<JsonObjectConst>();
                PinDescriptor pin;
                std::string purpose = readString(pin_obj, where.c_str(), "purpose", "");
                if (purpose == "reset") {
                    pin.purpose = PinPurpose::RESET;
                } else if (purpose == "self_boot") {
                    pin.purpose = PinPurpose::SELF_BOOT;
                } else {
                    throw ConfigError(where + ".purpose: expected reset or self_boot, got '" + purpose + "'");
                }
                if (pin_obj["gpio"].isNull()) {
                    throw ConfigError(where + ".gpio: missing");
                }
                pin.gpio = (int)readUnsigned(pin_obj, where.c_str(), "gpio", 0, 48);
                pin.active_high = readBool(pin_obj, where.c_str(), "active_high", true);
                pin.initial_state = readBool(pin_obj, where.c_str(), "initial_state", false);
                std::string direction = readString(pin_obj, where.c_str(), "direction", "output");
                if (direction != "output") {
                    throw ConfigError(where + ".direction: only output pins are supported");
                }
                for (const auto& other : pins) {
                    if (other.purpose == pin.purpose) {
                        throw ConfigError(where + ": duplicate " + pinPurposeToString(pin.purpose) + " pin");
                    }
                    if (other.gpio == pin.gpio) {
                        throw ConfigError(where + ": gpio " + std::to_string(pin.gpio) + " already assigned");
                    }
                }
                pins.push_back(pin);
            }
        }

        JsonObjectConst chip_obj = section(dsp, "chip");
        if (!chip_obj.isNull()) {
            // Register words are carried as 32-bit values end to end
            chip.word_size = readUnsigned(chip_obj, "dsp.chip", "word_size", (uint32_t)chip.word_size,
                                          (uint32_t)kRegisterWordBytes);
            chip.address_space = readUnsigned(chip_obj, "dsp.chip", "address_space", chip.address_space, 0x10000);
            if (!chip_obj["soft_reset_address"].isNull()) {
                chip.has_soft_reset = true;
                chip.soft_reset_address = (BusAddress)readUnsigned(chip_obj, "dsp.chip", "soft_reset_address",
                                                                   chip.soft_reset_address, 0xFFFF);
            }
            chip.reset_hold_ms = readUnsigned(chip_obj, "dsp.chip", "reset_hold_ms", chip.reset_hold_ms, 10000);
            chip.boot_delay_ms = readUnsigned(chip_obj, "dsp.chip", "boot_delay_ms", chip.boot_delay_ms, 10000);
            if (chip.word_size == 0) {
                throw ConfigError("dsp.chip.word_size: must be at least 1");
            }
            if (chip.address_space == 0) {
                throw ConfigError("dsp.chip.address_space: must be at least 1");
            }
        }

        JsonObjectConst sl_obj = section(dsp, "safeload");
        if (!sl_obj.isNull()) {
            safeload.data_slot_base = (BusAddress)readUnsigned(sl_obj, "dsp.safeload", "data_slot_base",
                                                               safeload.data_slot_base, 0xFFFF);
            safeload.address_slot_base = (BusAddress)readUnsigned(sl_obj, "dsp.safeload", "address_slot_base",
                                                                  safeload.address_slot_base, 0xFFFF);
            safeload.pending_count_address = (BusAddress)readUnsigned(sl_obj, "dsp.safeload", "pending_count_address",
                                                                      safeload.pending_count_address, 0xFFFF);
            safeload.core_control_address = (BusAddress)readUnsigned(sl_obj, "dsp.safeload", "core_control_address",
                                                                     safeload.core_control_address, 0xFFFF);
            safeload.commit_trigger_mask = (uint16_t)readUnsigned(sl_obj, "dsp.safeload", "commit_trigger_mask",
                                                                  safeload.commit_trigger_mask, 0xFFFF);
            safeload.slot_count = (uint8_t)readUnsigned(sl_obj, "dsp.safeload", "slot_count",
                                                        safeload.slot_count, 32);
            safeload.settle_us = readUnsigned(sl_obj, "dsp.safeload", "settle_us", safeload.settle_us, 1000000);
            if (safeload.slot_count == 0) {
                throw ConfigError("dsp.safeload.slot_count: must be at least 1");
            }
            if (safeload.commit_trigger_mask == 0) {
                throw ConfigError("dsp.safeload.commit_trigger_mask: must select at least one bit");
            }
        }
    }

    JsonObjectConst catalog_obj = section(root, "catalog");
    if (!catalog_obj.isNull()) {
        catalog.path = readString(catalog_obj, "catalog", "path", catalog.path);
        if (catalog.path.empty()) {
            throw ConfigError("catalog.path: must not be empty");
        }
    }

    JsonObjectConst net_obj = section(root, "network");
    if (!net_obj.isNull()) {
        network.tcp_host = readString(net_obj, "network", "tcp_host", network.tcp_host);
        network.tcp_port = (uint16_t)readUnsigned(net_obj, "network", "tcp_port", network.tcp_port, 0xFFFF);
        network.rpc_port = (uint16_t)readUnsigned(net_obj, "network", "rpc_port", network.rpc_port, 0xFFFF);
        if (network.tcp_port == 0 || network.rpc_port == 0) {
            throw ConfigError("network: ports must be non-zero");
        }
        if (network.tcp_port == network.rpc_port) {
            throw ConfigError("network: tcp_port and rpc_port must differ");
        }
    }

    JsonObjectConst log_obj = section(root, "logging");
    if (!log_obj.isNull()) {
        logging.log_level = readString(log_obj, "logging", "log_level", logging.log_level);
        logging.flush_on_write = readBool(log_obj, "logging", "flush_on_write", logging.flush_on_write);
        if (logging.log_level != "DEBUG" && logging.log_level != "INFO" &&
            logging.log_level != "WARN" && logging.log_level != "ERROR") {
            throw ConfigError("logging.log_level: expected DEBUG, INFO, WARN or ERROR");
        }
    }

    device_id_ = device_id;
    wifi_config_ = wifi;
    bus_config_ = bus;
    pin_configs_ = pins;
    chip_config_ = chip;
    safeload_layout_ = safeload;
    catalog_config_ = catalog;
    network_config_ = network;
    logging_config_ = logging;

    Logger::info("[ConfigMgr] Loaded configuration: bus=%s%u addr=0x%02X, %u pin(s), catalog=%s",
                 busKindToString(bus_config_.kind), (unsigned)bus_config_.bus_number,
                 (unsigned)bus_config_.device_address, (unsigned)pin_configs_.size(),
                 catalog_config_.path.c_str());
}

std::string ConfigManager::getDeviceId() const { return device_id_; }
WifiConfig ConfigManager::getWifiConfig() const { return wifi_config_; }
BusConfig ConfigManager::getBusConfig() const { return bus_config_; }
std::vector<PinDescriptor> ConfigManager::getPinConfig() const { return pin_configs_; }
ChipConfig ConfigManager::getChipConfig() const { return chip_config_; }
SafeloadLayout ConfigManager::getSafeloadLayout() const { return safeload_layout_; }
CatalogConfig ConfigManager::getCatalogConfig() const { return catalog_config_; }
NetworkConfig ConfigManager::getNetworkConfig() const { return network_config_; }
LoggingConfig ConfigManager::getLoggingConfig() const { return logging_config_; }
