#pragma once
#include <stdint.h>
#include <functional>
#include <string>
#include "dsp_context.hpp"
#include "parameter_request.hpp"

// Line-oriented JSON RPC. One request object per line in, one response
// object per line out:
//   {"id":1,"method":"write","name":"master_volume","values":[0.5]}
//   {"id":1,"status":"success","range_clamped":false,"values":[0.5]}
class RpcDispatcher {
public:
    // Supplies the parameter table text for reload_catalog
    typedef std::function<std::string()> CatalogSource;

    RpcDispatcher(DspContext& context, CatalogSource catalog_source);
    ~RpcDispatcher();

    // Never throws; malformed input yields an invalid_request response.
    std::string handleLine(const std::string& line);

    uint32_t handledCount() const { return handled_; }

private:
    DspContext& context_;
    CatalogSource catalog_source_;
    uint32_t handled_ = 0;
};
