#include "../include/bridge_servers.hpp"
#include "../include/logger.hpp"
#include <Arduino.h>

static IPAddress bindAddress(const std::string& host) {
    IPAddress addr((uint32_t)0);
    if (!host.empty() && !addr.fromString(host.c_str())) {
        Logger::warn("[Net] Cannot parse bind address '%s', listening on all interfaces", host.c_str());
        return IPAddress((uint32_t)0);
    }
    return addr;
}

// ---- SigmaStudio ----

SigmaStudioServer::SigmaStudioServer(AddressTranslator& translator, const std::string& host, uint16_t port,
                                     uint32_t max_payload_bytes)
    : translator_(translator), server_(bindAddress(host), port, 1), parser_(max_payload_bytes), port_(port) {
}

SigmaStudioServer::~SigmaStudioServer() {
    server_.end();
}

void SigmaStudioServer::begin() {
    server_.begin();
    Logger::info("[SigmaTCP] Listening on port %u", port_);
}

bool SigmaStudioServer::hasClient() {
    return client_ && client_.connected();
}

void SigmaStudioServer::dropClient(const char* reason) {
    Logger::info("[SigmaTCP] Closing programmer connection: %s", reason);
    client_.stop();
    parser_.reset();
}

void SigmaStudioServer::loop() {
    if (!hasClient()) {
        if (client_) dropClient("peer disconnected");
        WiFiClient incoming = server_.available();
        if (!incoming) return;
        client_ = incoming;
        Logger::info("[SigmaTCP] Programmer connected from %s", client_.remoteIP().toString().c_str());
    }

    uint8_t buf[512];
    while (client_.available() > 0) {
        int n = client_.read(buf, sizeof(buf));
        if (n <= 0) break;
        if (!parser_.feed(buf, (size_t)n)) {
            dropClient("oversized packet");
            return;
        }
    }

    // Each packet runs to completion, including any safeload commit it triggers
    SigmaStudioPacket packet;
    while (parser_.next(packet)) {
        ByteBuffer response = translator_.handle(packet);
        if (response.empty()) continue;
        size_t sent = client_.write(response.data(), response.size());
        if (sent != response.size()) {
            dropClient("read response could not be sent");
            return;
        }
    }
}

// ---- RPC ----

RpcServer::RpcServer(RpcDispatcher& dispatcher, const std::string& host, uint16_t port)
    : dispatcher_(dispatcher), server_(bindAddress(host), port, 1), port_(port) {
}

RpcServer::~RpcServer() {
    server_.end();
}

void RpcServer::begin() {
    server_.begin();
    Logger::info("[RPC] Listening on port %u", port_);
}

void RpcServer::loop() {
    if (!client_ || !client_.connected()) {
        if (client_) {
            client_.stop();
            line_.clear();
        }
        WiFiClient incoming = server_.available();
        if (!incoming) return;
        client_ = incoming;
        Logger::info("[RPC] Client connected from %s", client_.remoteIP().toString().c_str());
    }

    while (client_.available() > 0) {
        int c = client_.read();
        if (c < 0) break;
        if (c == '\r') continue;
        if (c != '\n') {
            line_.push_back((char)c);
            if (line_.size() > MAX_LINE_LENGTH) {
                Logger::warn("[RPC] Request line exceeds %u bytes, closing connection", (unsigned)MAX_LINE_LENGTH);
                client_.stop();
                line_.clear();
                return;
            }
            continue;
        }
        if (line_.empty()) continue;

        std::string response = dispatcher_.handleLine(line_);
        line_.clear();
        response.push_back('\n');
        if (client_.write((const uint8_t*)response.data(), response.size()) != response.size()) {
            Logger::warn("[RPC] Response could not be sent, closing connection");
            client_.stop();
            return;
        }
    }
}
