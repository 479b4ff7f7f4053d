#include "../include/rpc_dispatcher.hpp"
#include "../include/exceptions.hpp"
#include "../include/json_fields.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <cstring>
#include <utility>

namespace {

std::string serialize(const DynamicJsonDocument& doc) {
    std::string out;
    serializeJson(doc, out);
    return out;
}

std::string errorResponse(uint32_t id, ParameterStatus status, const std::string& details) {
    DynamicJsonDocument doc(JSON_OBJECT_SIZE(4) + details.size() + 1);
    doc["id"] = id;
    doc["status"] = parameterStatusToString(status);
    doc["range_clamped"] = false;
    doc["error"] = details;
    return serialize(doc);
}

bool readValues(JsonVariantConst v, std::vector<double>& out) {
    if (v.is<JsonArrayConst>()) {
        for (JsonVariantConst item : v.as<JsonArrayConst>()) {
            if (!item.is<double>()) return false;
            out.push_back(item.as<double>());
        }
        return true;
    }
    if (v.is<double>()) {
        out.push_back(v.as<double>());
        return true;
    }
    return false;
}

} // namespace

RpcDispatcher::RpcDispatcher(DspContext& context, CatalogSource catalog_source)
    : context_(context), catalog_source_(std::move(catalog_source)) {
}

RpcDispatcher::~RpcDispatcher() {}

std::string RpcDispatcher::handleLine(const std::string& line) {
    handled_++;

    DynamicJsonDocument request(jsonCapacityFor(line));
    DeserializationError error = deserializeJson(request, line);
    if (error) {
        Logger::warn("[RPC] Malformed request: %s", error.c_str());
        return errorResponse(0, ParameterStatus::INVALID_REQUEST, std::string("malformed JSON: ") + error.c_str());
    }
    if (!request.is<JsonObject>()) {
        return errorResponse(0, ParameterStatus::INVALID_REQUEST, "request must be a JSON object");
    }
    JsonObjectConst req = request.as<JsonObjectConst>();
    uint32_t id = req["id"] | 0u;
    const char* method = req["method"] | "";
    Logger::debug("[RPC] Request %u: %s", id, method);

    // Named-parameter methods go through the translator's request boundary
    ParameterRequest param;
    param.request_id = id;
    param.name = req["name"] | "";
    bool is_parameter_call = true;
    if (strcmp(method, "read") == 0) {
        param.action = ParameterAction::READ;
    } else if (strcmp(method, "write") == 0) {
        param.action = ParameterAction::WRITE;
        JsonVariantConst values = req["values"].isNull() ? req["value"] : req["values"];
        if (!readValues(values, param.values)) {
            return errorResponse(id, ParameterStatus::INVALID_REQUEST, "'values' must be a number or an array of numbers");
        }
    } else if (strcmp(method, "set_volume") == 0 || strcmp(method, "adjust_volume") == 0) {
        param.action = strcmp(method, "set_volume") == 0 ? ParameterAction::SET_VOLUME_DB
                                                         : ParameterAction::ADJUST_VOLUME_DB;
        if (!req["db"].is<double>()) {
            return errorResponse(id, ParameterStatus::INVALID_REQUEST, "'db' must be a number");
        }
        param.db = req["db"].as<double>();
    } else {
        is_parameter_call = false;
    }

    if (is_parameter_call) {
        if (param.name.empty()) {
            return errorResponse(id, ParameterStatus::INVALID_REQUEST, "'name' is required");
        }
        ParameterResult result = context_.parameterTranslator().execute(param);

        DynamicJsonDocument doc(JSON_OBJECT_SIZE(6) + JSON_ARRAY_SIZE(result.values.size()) +
                                result.error_details.size() + 1);
        doc["id"] = result.request_id;
        doc["status"] = parameterStatusToString(result.status);
        doc["range_clamped"] = result.range_clamped;
        if (result.status == ParameterStatus::SUCCESS) {
            JsonArray values = doc.createNestedArray("values");
            for (double v : result.values) values.add(v);
            if (param.action == ParameterAction::SET_VOLUME_DB || param.action == ParameterAction::ADJUST_VOLUME_DB) {
                doc["db"] = result.db;
            }
        } else {
            doc["error"] = result.error_details;
        }
        if (doc.overflowed()) {
            Logger::error("[RPC] Response to request %u does not fit %u bytes", id, (unsigned)doc.capacity());
            return errorResponse(id, ParameterStatus::FAILED, "response too large");
        }
        return serialize(doc);
    }

    // Maintenance methods
    DynamicJsonDocument doc(1024);
    doc["id"] = id;
    doc["range_clamped"] = false;
    try {
        if (strcmp(method, "hard_reset") == 0) {
            context_.hardReset();
        } else if (strcmp(method, "soft_reset") == 0) {
            context_.softReset();
        } else if (strcmp(method, "self_boot") == 0) {
            if (!req["enabled"].is<bool>()) {
                return errorResponse(id, ParameterStatus::INVALID_REQUEST, "'enabled' must be true or false");
            }
            context_.setSelfBoot(req["enabled"].as<bool>());
        } else if (strcmp(method, "reload_catalog") == 0) {
            if (!catalog_source_) {
                return errorResponse(id, ParameterStatus::FAILED, "no catalog source configured");
            }
            doc["parameters"] = (uint32_t)context_.reloadCatalog(catalog_source_());
        } else if (strcmp(method, "status") == 0) {
            DspStatus s = context_.status();
            JsonObject dsp = doc.createNestedObject("dsp");
            dsp["pin_state"] = pinStateToString(s.pin_state);
            dsp["self_boot"] = s.self_boot;
            dsp["transport"] = s.transport;
            dsp["reads"] = s.bus.reads;
            dsp["writes"] = s.bus.writes;
            dsp["failures"] = s.bus.failures;
            dsp["safeload_commits"] = s.safeload_commits;
            dsp["parameters"] = (uint32_t)s.parameter_count;
            dsp["catalog_generation"] = s.catalog_generation;
        } else {
            return errorResponse(id, ParameterStatus::INVALID_REQUEST, std::string("unknown method '") + method + "'");
        }
    } catch (const DspException& e) {
        Logger::warn("[RPC] %s failed: %s", method, e.what());
        return errorResponse(id, errorCodeToParameterStatus(e.code()), e.what());
    } catch (const std::exception& e) {
        Logger::error("[RPC] %s failed: %s", method, e.what());
        return errorResponse(id, ParameterStatus::FAILED, e.what());
    }

    doc["status"] = parameterStatusToString(ParameterStatus::SUCCESS);
    if (doc.overflowed()) {
        Logger::error("[RPC] Response to request %u does not fit %u bytes", id, (unsigned)doc.capacity());
        return errorResponse(id, ParameterStatus::FAILED, "response too large");
    }
    return serialize(doc);
}
