#pragma once
#include <memory>
#include <string>
#include <vector>
#include "dsp_bus.hpp"
#include "parameter_catalog.hpp"
#include "parameter_request.hpp"
#include "safeload_engine.hpp"

struct WriteOutcome {
    std::vector<double> applied;    // decoded from the words actually written
    bool range_clamped = false;
};

struct VolumeOutcome {
    double db = 0.0;
    double linear = 0.0;
    bool range_clamped = false;
};

// Named-parameter access for RPC clients. Names resolve against the
// catalog snapshot current at the start of each call.
class ParameterTranslator {
public:
    ParameterTranslator(std::shared_ptr<DspBus> bus, std::shared_ptr<SafeloadEngine> safeload,
                        std::shared_ptr<ParameterCatalogStore> catalogs);
    ~ParameterTranslator();

    // One value per register word. A single word is a plain write, anything
    // longer goes through one safeload transaction. A bit flag only changes
    // its own bit of the register.
    WriteOutcome write(const std::string& name, const std::vector<double>& values);
    std::vector<double> read(const std::string& name);

    // Volume helpers for one-word fixed-point gains; the gain is kept within [0, 1].
    VolumeOutcome setVolumeDb(const std::string& name, double db);
    VolumeOutcome adjustVolumeDb(const std::string& name, double step_db);

    // Request boundary for the RPC layer: maps every error to a status, never throws.
    ParameterResult execute(const ParameterRequest& request);

private:
    std::shared_ptr<DspBus> bus_;
    std::shared_ptr<SafeloadEngine> safeload_;
    std::shared_ptr<ParameterCatalogStore> catalogs_;

    ParameterDescriptor lookup(const std::string& name) const;
    ParameterDescriptor lookupVolume(const std::string& name) const;
    VolumeOutcome applyLinear(DspBus::Session& session, const ParameterDescriptor& d, double linear);
};
