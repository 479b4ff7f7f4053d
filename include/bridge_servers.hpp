#pragma once
#include <stdint.h>
#include <string>
#include <WiFi.h>
#include "address_translator.hpp"
#include "rpc_dispatcher.hpp"
#include "sigmastudio_frame.hpp"

// SigmaStudio TCP listener. One programmer connection at a time, polled
// from the Arduino loop.
class SigmaStudioServer {
public:
    SigmaStudioServer(AddressTranslator& translator, const std::string& host, uint16_t port,
                      uint32_t max_payload_bytes);
    ~SigmaStudioServer();

    void begin();
    void loop();
    bool hasClient();

private:
    AddressTranslator& translator_;
    WiFiServer server_;
    WiFiClient client_;
    SigmaStudioFrameParser parser_;
    uint16_t port_;

    void dropClient(const char* reason);
};

// Line-delimited JSON RPC listener.
class RpcServer {
public:
    RpcServer(RpcDispatcher& dispatcher, const std::string& host, uint16_t port);
    ~RpcServer();

    void begin();
    void loop();

private:
    RpcDispatcher& dispatcher_;
    WiFiServer server_;
    WiFiClient client_;
    std::string line_;
    uint16_t port_;

    static const size_t MAX_LINE_LENGTH = 8192;
};
