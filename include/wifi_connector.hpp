#pragma once
#include <string>
#include <cstdint>
#include "config_manager.hpp"

class WiFiConnector {
public:
    explicit WiFiConnector(const WifiConfig& config);
    ~WiFiConnector();

    void begin();
    // Non-blocking loop; will attempt reconnects periodically
    void loop();
    // Blocks until connected or the timeout passes
    bool waitConnected(uint32_t timeout_ms);
    bool isConnected() const;
    std::string localAddress() const;

private:
    std::string ssid_;
    std::string password_;
    uint32_t lastAttemptMs_ = 0;
    uint32_t reconnectIntervalMs_ = 10000; // try every 10s
};
