#pragma once
#include <stdint.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "fixed_point_codec.hpp"
#include "types.hpp"

struct ParameterDescriptor {
    std::string name;
    BusAddress address = 0;
    uint32_t word_count = 1;
    ParameterEncoding encoding;
    std::string alias_of;       // empty for a primary parameter

    bool isAlias() const { return !alias_of.empty(); }
    uint32_t lastAddress() const { return (uint32_t)address + word_count - 1; }
    bool contains(BusAddress addr) const { return addr >= address && addr <= lastAddress(); }
    RegisterSpan span() const {
        RegisterSpan s;
        s.address = address;
        s.length = word_count * (uint32_t)kRegisterWordBytes;
        return s;
    }
};

// Immutable name and address index over the parameter table. Instances are
// only handed out as shared_ptr<const>; a reload builds a new one.
class ParameterCatalog {
public:
    // Throws CatalogError naming the first bad row. Nothing is partially loaded.
    static std::shared_ptr<const ParameterCatalog> fromJson(const std::string& json, uint32_t address_space);

    ParameterCatalog(const std::vector<ParameterDescriptor>& descriptors, uint32_t address_space);

    // Both throw UnknownParameterError.
    const ParameterDescriptor& resolve(const std::string& name) const;
    const ParameterDescriptor& resolve(BusAddress address) const;

    bool contains(const std::string& name) const;
    size_t size() const { return descriptors_.size(); }
    const std::vector<ParameterDescriptor>& descriptors() const { return descriptors_; }

private:
    std::vector<ParameterDescriptor> descriptors_;
    std::map<std::string, size_t> by_name_;

    void validate(uint32_t address_space) const;
};

// Holds the active catalog snapshot. Readers take their own shared_ptr;
// a reload swaps the pointer only after the new table validated.
class ParameterCatalogStore {
public:
    ParameterCatalogStore();

    // Throws CatalogError when nothing has been loaded yet.
    std::shared_ptr<const ParameterCatalog> current() const;
    bool loaded() const;

    void replace(std::shared_ptr<const ParameterCatalog> catalog);

    // On failure the previous catalog stays active and the error propagates.
    size_t reloadFromJson(const std::string& json, uint32_t address_space);

    uint32_t generation() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const ParameterCatalog> catalog_;
    uint32_t generation_ = 0;
};
