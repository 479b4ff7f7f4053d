#include "../include/wifi_connector.hpp"
#include "../include/logger.hpp"
#include <Arduino.h>
#include <WiFi.h>

WiFiConnector::WiFiConnector(const WifiConfig& config)
    : ssid_(config.ssid), password_(config.password) {
}

WiFiConnector::~WiFiConnector() {}

void WiFiConnector::begin() {
    if (ssid_.empty()) {
        Logger::warn("[WiFi] No SSID configured, staying offline");
        return;
    }
    Logger::info("[WiFi] Connecting to SSID: %s", ssid_.c_str());
    WiFi.mode(WIFI_STA);
    WiFi.setAutoReconnect(true);
    WiFi.begin(ssid_.c_str(), password_.c_str());
    lastAttemptMs_ = millis();
}

void WiFiConnector::loop() {
    if (ssid_.empty()) return;
    if (WiFi.status() == WL_CONNECTED) return;
    unsigned long now = millis();
    if (now - lastAttemptMs_ >= reconnectIntervalMs_) {
        Logger::info("[WiFi] Attempting reconnect to %s", ssid_.c_str());
        WiFi.disconnect();
        WiFi.begin(ssid_.c_str(), password_.c_str());
        lastAttemptMs_ = now;
    }
}

bool WiFiConnector::waitConnected(uint32_t timeout_ms) {
    if (ssid_.empty()) return false;
    unsigned long start = millis();
    while (!isConnected() && millis() - start < timeout_ms) {
        loop();
        delay(500);
    }
    if (isConnected()) {
        Logger::info("[WiFi] Connected, address %s", localAddress().c_str());
        return true;
    }
    Logger::error("[WiFi] Connection failed after %u ms", (unsigned)timeout_ms);
    return false;
}

bool WiFiConnector::isConnected() const {
    return WiFi.status() == WL_CONNECTED;
}

std::string WiFiConnector::localAddress() const {
    return std::string(WiFi.localIP().toString().c_str());
}
