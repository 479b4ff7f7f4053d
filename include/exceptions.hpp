#pragma once

#include <string>
#include <exception>

enum ErrorCode {
    ERR_NONE = 0,
    ERR_BUS,
    ERR_NOT_READY,
    ERR_UNKNOWN_PARAMETER,
    ERR_TRANSACTION_TOO_LARGE,
    ERR_INVALID_REQUEST,
    ERR_CATALOG,
    ERR_CONFIG,
    ERR_UNKNOWN
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ERR_NONE: return "none";
        case ERR_BUS: return "bus_error";
        case ERR_NOT_READY: return "not_ready";
        case ERR_UNKNOWN_PARAMETER: return "unknown_parameter";
        case ERR_TRANSACTION_TOO_LARGE: return "transaction_too_large";
        case ERR_INVALID_REQUEST: return "invalid_request";
        case ERR_CATALOG: return "catalog_error";
        case ERR_CONFIG: return "config_error";
        default: return "unknown";
    }
}

class DspException : public std::exception {
public:
    DspException(const std::string& msg, ErrorCode code) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~DspException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};

// I/O failure talking to the chip (NACK, timeout, short read). Never retried here.
class BusError : public DspException {
public:
    explicit BusError(const std::string& msg) : DspException(msg, ERR_BUS) {}
};

// Bus access before the pin controller reached READY.
class NotReadyError : public DspException {
public:
    explicit NotReadyError(const std::string& msg) : DspException(msg, ERR_NOT_READY) {}
};

class UnknownParameterError : public DspException {
public:
    explicit UnknownParameterError(const std::string& msg) : DspException(msg, ERR_UNKNOWN_PARAMETER) {}
};

class TransactionTooLargeError : public DspException {
public:
    explicit TransactionTooLargeError(const std::string& msg) : DspException(msg, ERR_TRANSACTION_TOO_LARGE) {}
};

class InvalidRequestError : public DspException {
public:
    explicit InvalidRequestError(const std::string& msg) : DspException(msg, ERR_INVALID_REQUEST) {}
};

class CatalogError : public DspException {
public:
    explicit CatalogError(const std::string& msg) : DspException(msg, ERR_CATALOG) {}
};

class ConfigError : public DspException {
public:
    explicit ConfigError(const std::string& msg) : DspException(msg, ERR_CONFIG) {}
};
