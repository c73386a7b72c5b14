#pragma once

#include "sema/component_interface.h"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace prism {

struct CacheEntry {
    std::string unit;
    std::string content_hash;
    std::vector<std::string> artifacts;                 // relative to the output directory
    std::map<std::string, std::string> dependencies;    // unit -> content hash when written
    ComponentInterface interface;
};

// Per-unit results of previous passes. Passed explicitly into each build
// so independent builds never share state. Readers take a shared lock;
// entries are only written after a unit fully succeeded.
class BuildCache {
public:
    BuildCache() = default;
    BuildCache(const BuildCache&) = delete;
    BuildCache& operator=(const BuildCache&) = delete;

    std::optional<CacheEntry> find(const std::string& unit) const;
    void commit(CacheEntry entry);
    bool erase(const std::string& unit);
    void clear();

    size_t size() const;
    std::vector<std::string> units() const;
    std::map<std::string, CacheEntry> snapshot() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, CacheEntry> entries_;
};

} // namespace prism
