#pragma once
#include <stdint.h>
#include <vector>
#include <string>
#include "types.hpp"

struct LoggingConfig {
    std::string log_level;
    bool flush_on_write;
};

struct WifiConfig {
    std::string ssid;
    std::string password;
};

enum class BusKind {
    SPI,
    I2C
};

struct BusConfig {
    BusKind kind;
    uint8_t bus_number;
    uint8_t device_address;         // SPI chip address byte or 7-bit I2C address
    uint32_t clock_hz;
    int cs_gpio;                    // SPI only
    int sda_gpio;                   // I2C only
    int scl_gpio;                   // I2C only
    uint8_t transfer_granularity;   // minimum transfer unit in bytes
    uint32_t timeout_ms;            // per-transaction deadline
    uint32_t max_transfer_bytes;
};

enum class PinPurpose {
    RESET,
    SELF_BOOT
};

struct PinDescriptor {
    PinPurpose purpose;
    int gpio;
    bool active_high;
    bool initial_state;             // logical state, polarity applied by the controller
};

struct ChipConfig {
    size_t word_size;               // bytes per native register word
    uint32_t address_space;         // first invalid register address
    bool has_soft_reset;
    BusAddress soft_reset_address;
    uint32_t reset_hold_ms;
    uint32_t boot_delay_ms;
};

// Register block of the chip's hardware safeload mechanism.
struct SafeloadLayout {
    BusAddress data_slot_base;          // slot i data word at data_slot_base + i
    BusAddress address_slot_base;       // slot i target address at address_slot_base + i
    BusAddress pending_count_address;
    BusAddress core_control_address;
    uint16_t commit_trigger_mask;
    uint8_t slot_count;
    uint32_t settle_us;
};

struct CatalogConfig {
    std::string path;
};

struct NetworkConfig {
    std::string tcp_host;
    uint16_t tcp_port;
    uint16_t rpc_port;
};

inline const char* busKindToString(BusKind kind) {
    return kind == BusKind::I2C ? "i2c" : "spi";
}

inline const char* pinPurposeToString(PinPurpose purpose) {
    return purpose == PinPurpose::SELF_BOOT ? "self_boot" : "reset";
}

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Overrides the defaults with a JSON document. Throws ConfigError naming
    // the offending key; on failure the previous settings stay untouched.
    void loadFromJson(const std::string& json);

    std::string getDeviceId() const;
    WifiConfig getWifiConfig() const;
    BusConfig getBusConfig() const;
    std::vector<PinDescriptor> getPinConfig() const;
    ChipConfig getChipConfig() const;
    SafeloadLayout getSafeloadLayout() const;
    CatalogConfig getCatalogConfig() const;
    NetworkConfig getNetworkConfig() const;
    LoggingConfig getLoggingConfig() const;

private:
    std::string device_id_;
    WifiConfig wifi_config_;
    BusConfig bus_config_;
    std::vector<PinDescriptor> pin_configs_;
    ChipConfig chip_config_;
    SafeloadLayout safeload_layout_;
    CatalogConfig catalog_config_;
    NetworkConfig network_config_;
    LoggingConfig logging_config_;

    void initializeDefaults();
};
