#include "build/build_cache.h"

#include <mutex>

namespace prism {

std::optional<CacheEntry> BuildCache::find(const std::string& unit) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(unit);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void BuildCache::commit(CacheEntry entry) {
    std::unique_lock lock(mutex_);
    std::string unit = entry.unit;
    entries_[unit] = std::move(entry);
}

bool BuildCache::erase(const std::string& unit) {
    std::unique_lock lock(mutex_);
    return entries_.erase(unit) > 0;
}

void BuildCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

size_t BuildCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::vector<std::string> BuildCache::units() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [unit, entry] : entries_) {
        result.push_back(unit);
    }
    return result;
}

std::map<std::string, CacheEntry> BuildCache::snapshot() const {
    std::shared_lock lock(mutex_);
    return entries_;
}

} // namespace prism
