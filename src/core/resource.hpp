#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <core/types.hpp>
#include <core/storage_value.hpp>

// One <resource name="..." type="...">value</resource> entry from a queue listing
struct Resource {
    std::string name;   // "mem_free", "load_short", "num_proc"
    std::string type;   // scheduler type tag ("hl", "qf", ...)
    std::string value;  // raw text, untyped
};

// Flat, unordered list of host/queue metrics. Names are not unique; lookups
// return the first match. Every accessor rescans the list.
//
// Not internally synchronized: concurrent readers are fine, writers need
// external locking.
class ResourceList {
public:
    ResourceList() = default;
    ResourceList(std::vector<Resource> resources) : resources_(std::move(resources)) {}

    void add(Resource r) { resources_.push_back(std::move(r)); }

    size_t size() const { return resources_.size(); }
    bool empty() const { return resources_.empty(); }
    const Resource& operator[](size_t i) const { return resources_[i]; }
    std::vector<Resource>::const_iterator begin() const { return resources_.begin(); }
    std::vector<Resource>::const_iterator end() const { return resources_.end(); }

    // First resource named `key`, or NotFound.
    Result<Resource> find(const std::string& key) const;

    // Lookup + coercion. NotFound when the key is absent, Parse when the
    // value does not convert.
    Result<double> get_float(const std::string& key) const;
    Result<int64_t> get_integer(const std::string& key) const;
    Result<StorageValue> get_storage(const std::string& key) const;

    // ── Typed metrics ────────────────────────────────────────

    // window: "short", "medium" or "long" (reads load_<window>)
    Result<double> load(const std::string& window) const;

    // num_proc as a 32-bit count
    Result<int32_t> num_processors() const;

    Result<StorageValue> free_memory() const         { return get_storage("mem_free"); }
    Result<StorageValue> free_swap() const           { return get_storage("swap_free"); }
    Result<StorageValue> free_virtual_memory() const { return get_storage("virtual_free"); }
    Result<StorageValue> total_memory() const        { return get_storage("mem_total"); }
    Result<StorageValue> total_swap() const          { return get_storage("swap_total"); }
    Result<StorageValue> total_virtual() const       { return get_storage("virtual_total"); }
    Result<StorageValue> memory_used() const         { return get_storage("mem_used"); }
    Result<StorageValue> swap_used() const           { return get_storage("swap_used"); }

private:
    std::vector<Resource> resources_;
};
