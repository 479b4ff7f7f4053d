#pragma once
#include <stdint.h>
#include <string>
#include "bridge_servers.hpp"
#include "config_manager.hpp"
#include "dsp_context.hpp"
#include "rpc_dispatcher.hpp"
#include "wifi_connector.hpp"

class BridgeDevice {
public:
    BridgeDevice();
    ~BridgeDevice();

    // Loads configuration and the parameter table, brings the DSP up and
    // starts both listeners. Any startup error leaves the device in a fault
    // state that serves nothing.
    void setup();
    void loop();

    bool isServing() const { return serving_; }
    const std::string& faultReason() const { return fault_reason_; }

    // Serial console actions
    void printStatus();
    void hardReset();
    void softReset();
    void setSelfBoot(bool enabled);
    void reloadCatalog();

private:
    ConfigManager* config_ = nullptr;
    WiFiConnector* wifi_ = nullptr;
    DspContext* dsp_ = nullptr;
    RpcDispatcher* dispatcher_ = nullptr;
    SigmaStudioServer* sigma_server_ = nullptr;
    RpcServer* rpc_server_ = nullptr;

    bool serving_ = false;
    std::string fault_reason_;

    void enterFault(const char* stage, const std::string& reason);
    std::string readCatalogFile() const;
};
