#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "exceptions.hpp"

// Named-parameter request from an RPC client
enum class ParameterAction {
    READ,
    WRITE,
    SET_VOLUME_DB,                    // absolute level in dB
    ADJUST_VOLUME_DB                  // relative step in dB
};

struct ParameterRequest {
    uint32_t request_id = 0;
    ParameterAction action = ParameterAction::READ;
    std::string name;                 // catalog name
    std::vector<double> values;       // WRITE: one per register word
    double db = 0.0;                  // volume actions
};

enum class ParameterStatus {
    SUCCESS,
    UNKNOWN_PARAMETER,
    TRANSACTION_TOO_LARGE,
    INVALID_REQUEST,
    BUS_ERROR,
    NOT_READY,
    FAILED
};

struct ParameterResult {
    uint32_t request_id = 0;
    ParameterStatus status = ParameterStatus::FAILED;
    bool range_clamped = false;       // at least one value was saturated
    std::vector<double> values;       // values read, or actually applied
    double db = 0.0;                  // volume actions: resulting level
    std::string error_details;
};

inline const char* parameterActionToString(ParameterAction action) {
    switch (action) {
        case ParameterAction::READ: return "read";
        case ParameterAction::WRITE: return "write";
        case ParameterAction::SET_VOLUME_DB: return "set_volume";
        case ParameterAction::ADJUST_VOLUME_DB: return "adjust_volume";
        default: return "unknown";
    }
}

inline const char* parameterStatusToString(ParameterStatus status) {
    switch (status) {
        case ParameterStatus::SUCCESS: return "success";
        case ParameterStatus::UNKNOWN_PARAMETER: return "unknown_parameter";
        case ParameterStatus::TRANSACTION_TOO_LARGE: return "transaction_too_large";
        case ParameterStatus::INVALID_REQUEST: return "invalid_request";
        case ParameterStatus::BUS_ERROR: return "bus_error";
        case ParameterStatus::NOT_READY: return "not_ready";
        case ParameterStatus::FAILED: return "failed";
        default: return "failed";
    }
}

inline ParameterStatus errorCodeToParameterStatus(ErrorCode code) {
    switch (code) {
        case ERR_NONE: return ParameterStatus::SUCCESS;
        case ERR_BUS: return ParameterStatus::BUS_ERROR;
        case ERR_NOT_READY: return ParameterStatus::NOT_READY;
        case ERR_UNKNOWN_PARAMETER: return ParameterStatus::UNKNOWN_PARAMETER;
        case ERR_TRANSACTION_TOO_LARGE: return ParameterStatus::TRANSACTION_TOO_LARGE;
        case ERR_INVALID_REQUEST: return ParameterStatus::INVALID_REQUEST;
        default: return ParameterStatus::FAILED;
    }
}
