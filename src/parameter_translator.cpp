#include "../include/parameter_translator.hpp"
#include "../include/exceptions.hpp"
#include "../include/fixed_point_codec.hpp"
#include "../include/logger.hpp"
#include <cmath>
#include <utility>

ParameterTranslator::ParameterTranslator(std::shared_ptr<DspBus> bus, std::shared_ptr<SafeloadEngine> safeload,
                                         std::shared_ptr<ParameterCatalogStore> catalogs)
    : bus_(std::move(bus)), safeload_(std::move(safeload)), catalogs_(std::move(catalogs)) {
}

ParameterTranslator::~ParameterTranslator() {}

ParameterDescriptor ParameterTranslator::lookup(const std::string& name) const {
    std::shared_ptr<const ParameterCatalog> catalog = catalogs_->current();
    return catalog->resolve(name);
}

ParameterDescriptor ParameterTranslator::lookupVolume(const std::string& name) const {
    ParameterDescriptor d = lookup(name);
    if (d.word_count != 1 || d.encoding.kind != EncodingKind::FIXED_POINT) {
        throw InvalidRequestError("'" + name + "' is not a one-word fixed-point gain");
    }
    return d;
}

WriteOutcome ParameterTranslator::write(const std::string& name, const std::vector<double>& values) {
    ParameterDescriptor d = lookup(name);
    if (values.size() != d.word_count) {
        throw InvalidRequestError("'" + name + "' takes " + std::to_string(d.word_count) + " value(s), got " +
                                  std::to_string(values.size()));
    }

    // Encode everything before touching the bus
    WriteOutcome outcome;
    std::vector<RegisterWord> words;
    for (double value : values) {
        EncodedWord encoded = encodeValue(value, d.encoding);
        words.push_back(encoded.word);
        outcome.applied.push_back(decodeWord(encoded.word, d.encoding));
        outcome.range_clamped = outcome.range_clamped || encoded.clamped;
    }
    if (outcome.range_clamped) {
        Logger::warn("[Params] Value for '%s' clamped to the %s range", name.c_str(), d.encoding.describe().c_str());
    }

    if (d.encoding.kind == EncodingKind::BIT_FLAG) {
        // Other bits of the register belong to other flags or live control state
        const RegisterWord mask = (RegisterWord)1u << d.encoding.bit;
        DspBus::Session session = bus_->acquire();
        RegisterWord current = unpackWords(session.read(d.address, kRegisterWordBytes)).front();
        RegisterWord merged = (current & ~mask) | (words.front() & mask);
        session.write(d.address, packWords(std::vector<RegisterWord>(1, merged)));
    } else if (words.size() == 1) {
        bus_->write(d.address, packWords(words));
    } else {
        SafeloadTransaction txn;
        for (size_t i = 0; i < words.size(); ++i) {
            txn.add((BusAddress)(d.address + i), words[i]);
        }
        safeload_->commit(txn);
    }
    Logger::debug("[Params] Wrote %u word(s) to '%s' at 0x%04X", (unsigned)words.size(), name.c_str(), d.address);
    return outcome;
}

std::vector<double> ParameterTranslator::read(const std::string& name) {
    ParameterDescriptor d = lookup(name);
    RegisterSpan span = d.span();
    ByteBuffer bytes = bus_->read(span.address, span.length);
    std::vector<RegisterWord> words = unpackWords(bytes);
    std::vector<double> values;
    for (RegisterWord w : words) {
        values.push_back(decodeWord(w, d.encoding));
    }
    return values;
}

VolumeOutcome ParameterTranslator::applyLinear(DspBus::Session& session, const ParameterDescriptor& d,
                                               double linear) {
    VolumeOutcome outcome;
    if (linear > 1.0) {
        linear = 1.0;
        outcome.range_clamped = true;
    } else if (linear < 0.0) {
        linear = 0.0;
        outcome.range_clamped = true;
    }
    EncodedWord encoded = encodeValue(linear, d.encoding);
    session.write(d.address, packWords(std::vector<RegisterWord>(1, encoded.word)));
    outcome.linear = decodeWord(encoded.word, d.encoding);
    outcome.db = linearToDb(outcome.linear);
    outcome.range_clamped = outcome.range_clamped || encoded.clamped;
    return outcome;
}

VolumeOutcome ParameterTranslator::setVolumeDb(const std::string& name, double db) {
    if (std::isnan(db)) {
        throw InvalidRequestError("volume level is not a number");
    }
    ParameterDescriptor d = lookupVolume(name);
    DspBus::Session session = bus_->acquire();
    VolumeOutcome outcome = applyLinear(session, d, dbToLinear(db));
    Logger::info("[Params] Set '%s' to %.2f dB", name.c_str(), outcome.db);
    return outcome;
}

VolumeOutcome ParameterTranslator::adjustVolumeDb(const std::string& name, double step_db) {
    if (std::isnan(step_db)) {
        throw InvalidRequestError("volume step is not a number");
    }
    ParameterDescriptor d = lookupVolume(name);
    // Read and write under one hold so concurrent steps do not overwrite each other
    DspBus::Session session = bus_->acquire();
    ByteBuffer bytes = session.read(d.address, kRegisterWordBytes);
    double current = decodeWord(unpackWords(bytes).front(), d.encoding);
    VolumeOutcome outcome = applyLinear(session, d, current * dbToLinear(step_db));
    Logger::info("[Params] Adjusted '%s' from %.2f dB to %.2f dB", name.c_str(), linearToDb(current), outcome.db);
    return outcome;
}

ParameterResult ParameterTranslator::execute(const ParameterRequest& request) {
    ParameterResult result;
    result.request_id = request.request_id;

    try {
        switch (request.action) {
            case ParameterAction::READ:
                result.values = read(request.name);
                break;
            case ParameterAction::WRITE: {
                WriteOutcome outcome = write(request.name, request.values);
                result.values = outcome.applied;
                result.range_clamped = outcome.range_clamped;
                break;
            }
            case ParameterAction::SET_VOLUME_DB:
            case ParameterAction::ADJUST_VOLUME_DB: {
                VolumeOutcome outcome = request.action == ParameterAction::SET_VOLUME_DB
                                            ? setVolumeDb(request.name, request.db)
                                            : adjustVolumeDb(request.name, request.db);
                result.db = outcome.db;
                result.values.push_back(outcome.linear);
                result.range_clamped = outcome.range_clamped;
                break;
            }
        }
        result.status = ParameterStatus::SUCCESS;
    } catch (const DspException& e) {
        result.status = errorCodeToParameterStatus(e.code());
        result.error_details = e.what();
        result.values.clear();
        Logger::warn("[Params] Request %u (%s '%s') failed: %s", request.request_id,
                     parameterActionToString(request.action), request.name.c_str(), e.what());
    } catch (const std::exception& e) {
        result.status = ParameterStatus::FAILED;
        result.error_details = e.what();
        result.values.clear();
        Logger::error("[Params] Request %u failed unexpectedly: %s", request.request_id, e.what());
    }
    return result;
}
