#include "../include/parameter_catalog.hpp"
#include "../include/exceptions.hpp"
#include "../include/json_fields.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <cstdio>
#include <cstring>
#include <utility>

namespace {

std::string rowLabel(size_t index, const std::string& name) {
    std::string label = "parameters[" + std::to_string(index) + "]";
    if (!name.empty()) label += " (" + name + ")";
    return label;
}

uint32_t rowUnsigned(JsonObjectConst row, const char* key, const std::string& label, bool required,
                     uint32_t fallback) {
    JsonVariantConst v = row[key];
    if (v.isNull()) {
        if (required) throw CatalogError(label + ": missing '" + key + "'");
        return fallback;
    }
    uint32_t out = 0;
    if (!jsonToUnsigned(v, out)) {
        throw CatalogError(label + ": '" + key + "' must be a non-negative 32-bit integer");
    }
    return out;
}

ParameterEncoding parseEncoding(JsonVariantConst v, const std::string& label) {
    if (!v.is<JsonObjectConst>()) {
        throw CatalogError(label + ": 'encoding' must be an object");
    }
    JsonObjectConst obj = v.as<JsonObjectConst>();
    const char* type = obj["type"] | "";

    ParameterEncoding enc;
    if (strcmp(type, "fixed_point") == 0) {
        uint32_t integer_bits = rowUnsigned(obj, "integer_bits", label, false, 5);
        uint32_t fractional_bits = rowUnsigned(obj, "fractional_bits", label, false, 23);
        if (integer_bits < 1 || integer_bits + fractional_bits > 32) {
            throw CatalogError(label + ": fixed-point format Q" + std::to_string(integer_bits) + "." +
                               std::to_string(fractional_bits) + " does not fit a 32-bit word");
        }
        enc = ParameterEncoding::fixedPoint((uint8_t)integer_bits, (uint8_t)fractional_bits);
    } else if (strcmp(type, "raw_integer") == 0) {
        uint32_t bits = rowUnsigned(obj, "bits", label, false, 32);
        if (bits < 1 || bits > 32) {
            throw CatalogError(label + ": raw integer width must be 1..32 bits");
        }
        JsonVariantConst is_signed = obj["signed"];
        if (!is_signed.isNull() && !is_signed.is<bool>()) {
            throw CatalogError(label + ": 'signed' must be true or false");
        }
        enc = ParameterEncoding::rawInteger((uint8_t)bits, is_signed.isNull() ? true : is_signed.as<bool>());
    } else if (strcmp(type, "bit_flag") == 0) {
        uint32_t bit = rowUnsigned(obj, "bit", label, false, 0);
        if (bit > 31) {
            throw CatalogError(label + ": flag bit must be 0..31");
        }
        enc = ParameterEncoding::bitFlag((uint8_t)bit);
    } else {
        throw CatalogError(label + ": unknown encoding type '" + std::string(type) + "'");
    }
    return enc;
}

std::string describeSpan(const ParameterDescriptor& d) {
    char buf[32];
    snprintf(buf, sizeof(buf), "0x%04X..0x%04X", d.address, d.lastAddress());
    return buf;
}

// The primary a descriptor belongs to; aliases share their primary's group
const std::string& aliasGroup(const ParameterDescriptor& d) {
    return d.isAlias() ? d.alias_of : d.name;
}

} // namespace

std::shared_ptr<const ParameterCatalog> ParameterCatalog::fromJson(const std::string& json,
                                                                   uint32_t address_space) {
    DynamicJsonDocument doc(jsonCapacityFor(json));
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        throw CatalogError(std::string("parameter table is not valid JSON: ") + error.c_str());
    }
    if (!doc.is<JsonObject>()) {
        throw CatalogError("parameter table root must be an object");
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();
    JsonVariantConst rows = root["parameters"];
    if (!rows.is<JsonArrayConst>()) {
        throw CatalogError("parameter table must contain a 'parameters' array");
    }

    std::vector<ParameterDescriptor> descriptors;
    size_t index = 0;
    for (JsonVariantConst v : rows.as<JsonArrayConst>()) {
        std::string label = rowLabel(index, "");
        if (!v.is<JsonObjectConst>()) {
            throw CatalogError(label + ": expected an object");
        }
        JsonObjectConst row = v.as<JsonObjectConst>();

        const char* name = row["name"] | "";
        if (!*name) {
            throw CatalogError(label + ": missing 'name'");
        }
        ParameterDescriptor d;
        d.name = name;
        label = rowLabel(index, d.name);

        uint32_t address = rowUnsigned(row, "address", label, true, 0);
        if (address > 0xFFFF) {
            throw CatalogError(label + ": address " + std::to_string(address) + " is not a 16-bit address");
        }
        d.address = (BusAddress)address;
        d.word_count = rowUnsigned(row, "word_count", label, false, 1);
        d.encoding = parseEncoding(row["encoding"], label);

        JsonVariantConst alias = row["alias_of"];
        if (!alias.isNull()) {
            if (!alias.is<const char*>() || !*alias.as<const char*>()) {
                throw CatalogError(label + ": 'alias_of' must be a parameter name");
            }
            d.alias_of = alias.as<const char*>();
        }

        descriptors.push_back(d);
        index++;
    }

    return std::make_shared<const ParameterCatalog>(descriptors, address_space);
}

ParameterCatalog::ParameterCatalog(const std::vector<ParameterDescriptor>& descriptors, uint32_t address_space)
    : descriptors_(descriptors) {
    for (size_t i = 0; i < descriptors_.size(); ++i) {
        if (!by_name_.insert(std::make_pair(descriptors_[i].name, i)).second) {
            throw CatalogError(rowLabel(i, descriptors_[i].name) + ": duplicate parameter name");
        }
    }
    validate(address_space);
    Logger::info("[Catalog] Loaded %u parameter(s)", (unsigned)descriptors_.size());
}

void ParameterCatalog::validate(uint32_t address_space) const {
    for (size_t i = 0; i < descriptors_.size(); ++i) {
        const ParameterDescriptor& d = descriptors_[i];
        std::string label = rowLabel(i, d.name);

        if (d.word_count < 1) {
            throw CatalogError(label + ": word_count must be at least 1");
        }
        if (d.word_count % d.encoding.wordsPerValue() != 0) {
            throw CatalogError(label + ": word_count " + std::to_string(d.word_count) + " does not match the " +
                               d.encoding.describe() + " encoding width");
        }
        if ((uint64_t)d.address + d.word_count > address_space) {
            throw CatalogError(label + ": span " + describeSpan(d) + " leaves the chip's address space");
        }
        if (d.isAlias()) {
            auto target = by_name_.find(d.alias_of);
            if (target == by_name_.end()) {
                throw CatalogError(label + ": alias_of names unknown parameter '" + d.alias_of + "'");
            }
            if (descriptors_[target->second].isAlias()) {
                throw CatalogError(label + ": alias_of must name a primary parameter, '" + d.alias_of +
                                   "' is itself an alias");
            }
        }
    }

    for (size_t i = 0; i < descriptors_.size(); ++i) {
        for (size_t j = i + 1; j < descriptors_.size(); ++j) {
            const ParameterDescriptor& a = descriptors_[i];
            const ParameterDescriptor& b = descriptors_[j];
            bool overlap = a.address <= b.lastAddress() && b.address <= a.lastAddress();
            if (overlap && aliasGroup(a) != aliasGroup(b)) {
                throw CatalogError(rowLabel(j, b.name) + ": span " + describeSpan(b) + " overlaps '" + a.name +
                                   "' at " + describeSpan(a) + " without an alias declaration");
            }
        }
    }
}

const ParameterDescriptor& ParameterCatalog::resolve(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        throw UnknownParameterError("unknown parameter '" + name + "'");
    }
    return descriptors_[it->second];
}

const ParameterDescriptor& ParameterCatalog::resolve(BusAddress address) const {
    const ParameterDescriptor* alias_hit = nullptr;
    for (const auto& d : descriptors_) {
        if (!d.contains(address)) continue;
        if (!d.isAlias()) return d;
        if (!alias_hit) alias_hit = &d;
    }
    if (alias_hit) return *alias_hit;

    char buf[16];
    snprintf(buf, sizeof(buf), "0x%04X", address);
    throw UnknownParameterError(std::string("no parameter at address ") + buf);
}

bool ParameterCatalog::contains(const std::string& name) const {
    return by_name_.find(name) != by_name_.end();
}

ParameterCatalogStore::ParameterCatalogStore() {}

std::shared_ptr<const ParameterCatalog> ParameterCatalogStore::current() const {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!catalog_) {
        throw CatalogError("no parameter catalog loaded");
    }
    return catalog_;
}

bool ParameterCatalogStore::loaded() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return catalog_ != nullptr;
}

void ParameterCatalogStore::replace(std::shared_ptr<const ParameterCatalog> catalog) {
    if (!catalog) {
        throw CatalogError("cannot install an empty catalog handle");
    }
    std::lock_guard<std::mutex> guard(mutex_);
    catalog_ = std::move(catalog);
    generation_++;
}

size_t ParameterCatalogStore::reloadFromJson(const std::string& json, uint32_t address_space) {
    std::shared_ptr<const ParameterCatalog> fresh;
    try {
        fresh = ParameterCatalog::fromJson(json, address_space);
    } catch (const CatalogError& e) {
        Logger::error("[Catalog] Reload rejected, keeping the active table: %s", e.what());
        throw;
    }
    size_t count = fresh->size();
    replace(fresh);
    Logger::info("[Catalog] Swapped in reloaded table (generation %u)", (unsigned)generation());
    return count;
}

uint32_t ParameterCatalogStore::generation() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return generation_;
}
