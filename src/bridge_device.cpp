#include <Arduino.h>
#include <FS.h>
#include <LittleFS.h>
#include "../include/bridge_device.hpp"
#include "../include/arduino_bus.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"

static const char* kConfigPath = "/config/bridge.json";

static bool readTextFile(const char* path, std::string& out) {
    if (!LittleFS.exists(path)) return false;
    File f = LittleFS.open(path, "r");
    if (!f) return false;
    out.clear();
    out.reserve(f.size());
    char buf[256];
    while (f.available()) {
        size_t n = f.readBytes(buf, sizeof(buf));
        if (n == 0) break;
        out.append(buf, n);
    }
    f.close();
    return true;
}

BridgeDevice::BridgeDevice() {}

BridgeDevice::~BridgeDevice() {
    delete rpc_server_;
    delete sigma_server_;
    delete dispatcher_;
    delete dsp_;
    delete wifi_;
    delete config_;
}

void BridgeDevice::enterFault(const char* stage, const std::string& reason) {
    serving_ = false;
    fault_reason_ = std::string(stage) + ": " + reason;
    Logger::error("[Bridge] Startup aborted during %s: %s", stage, reason.c_str());
    Logger::error("[Bridge] Not serving requests until the fault is fixed and the board restarted");
}

std::string BridgeDevice::readCatalogFile() const {
    std::string path = config_->getCatalogConfig().path;
    std::string text;
    if (!readTextFile(path.c_str(), text)) {
        throw CatalogError("cannot read parameter table " + path);
    }
    return text;
}

void BridgeDevice::setup() {
    Logger::info("[Bridge] SigmaDSP bridge initializing...");

    config_ = new ConfigManager();
    std::string config_text;
    if (readTextFile(kConfigPath, config_text)) {
        try {
            config_->loadFromJson(config_text);
        } catch (const ConfigError& e) {
            enterFault("configuration", e.what());
            return;
        }
    } else {
        Logger::warn("[Bridge] %s not found, running on built-in defaults", kConfigPath);
    }
    Logger::begin(config_->getLoggingConfig());
    Logger::info("[Bridge] Device id: %s", config_->getDeviceId().c_str());

    BusConfig bus = config_->getBusConfig();
    dsp_ = new DspContext(*config_, createBusTransport(bus), std::unique_ptr<GpioDriver>(new ArduinoGpio()));
    try {
        dsp_->bringUp();
    } catch (const DspException& e) {
        enterFault("DSP bring-up", e.what());
        return;
    }

    try {
        size_t count = dsp_->loadCatalog(readCatalogFile());
        Logger::info("[Bridge] Parameter table ready with %u entries", (unsigned)count);
    } catch (const CatalogError& e) {
        enterFault("parameter table", e.what());
        return;
    }

    wifi_ = new WiFiConnector(config_->getWifiConfig());
    wifi_->begin();
    Logger::info("[Bridge] Waiting for WiFi connection...");
    if (!wifi_->waitConnected(30000)) {
        Logger::warn("[Bridge] Listeners start anyway; clients can connect once WiFi is up");
    }

    NetworkConfig net = config_->getNetworkConfig();
    dispatcher_ = new RpcDispatcher(*dsp_, [this]() { return readCatalogFile(); });
    sigma_server_ = new SigmaStudioServer(dsp_->addressTranslator(), net.tcp_host, net.tcp_port,
                                          bus.max_transfer_bytes);
    rpc_server_ = new RpcServer(*dispatcher_, net.tcp_host, net.rpc_port);
    sigma_server_->begin();
    rpc_server_->begin();

    serving_ = true;
    Logger::info("[Bridge] Ready: SigmaStudio on %u, RPC on %u", net.tcp_port, net.rpc_port);
}

void BridgeDevice::loop() {
    if (!serving_) return;
    wifi_->loop();
    sigma_server_->loop();
    rpc_server_->loop();
}

void BridgeDevice::printStatus() {
    if (!dsp_) {
        Serial.printf("[STATUS] Not initialized (%s)\n", fault_reason_.c_str());
        return;
    }
    DspStatus s = dsp_->status();
    Serial.println("\n========== BRIDGE STATUS ==========");
    Serial.printf("Serving:          %s\n", serving_ ? "yes" : "no");
    if (!serving_) Serial.printf("Fault:            %s\n", fault_reason_.c_str());
    Serial.printf("WiFi:             %s\n", wifi_ && wifi_->isConnected() ? wifi_->localAddress().c_str() : "offline");
    Serial.printf("Pin state:        %s\n", pinStateToString(s.pin_state));
    Serial.printf("Self-boot:        %s\n", s.self_boot ? "on" : "off");
    Serial.printf("Transport:        %s\n", s.transport.c_str());
    Serial.printf("Bus reads/writes: %u / %u (%u failed)\n", s.bus.reads, s.bus.writes, s.bus.failures);
    Serial.printf("Safeload commits: %u\n", s.safeload_commits);
    Serial.printf("Parameters:       %u (generation %u)\n", (unsigned)s.parameter_count, s.catalog_generation);
    Serial.println("===================================\n");
}

void BridgeDevice::hardReset() {
    if (!dsp_) return;
    try {
        dsp_->hardReset();
    } catch (const DspException& e) {
        Logger::error("[Bridge] Hard reset failed: %s", e.what());
    }
}

void BridgeDevice::softReset() {
    if (!dsp_) return;
    try {
        dsp_->softReset();
    } catch (const DspException& e) {
        Logger::error("[Bridge] Soft reset failed: %s", e.what());
    }
}

void BridgeDevice::setSelfBoot(bool enabled) {
    if (!dsp_) return;
    try {
        dsp_->setSelfBoot(enabled);
    } catch (const DspException& e) {
        Logger::error("[Bridge] Self-boot change failed: %s", e.what());
    }
}

void BridgeDevice::reloadCatalog() {
    if (!dsp_) return;
    try {
        size_t count = dsp_->reloadCatalog(readCatalogFile());
        Logger::info("[Bridge] Parameter table reloaded with %u entries", (unsigned)count);
    } catch (const CatalogError& e) {
        Logger::error("[Bridge] Reload failed, previous table stays active: %s", e.what());
    }
}
