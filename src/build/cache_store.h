#pragma once

#include "build/build_cache.h"
#include "common/diagnostics.h"

#include <string>

namespace prism {

// Persistence for a BuildCache between runs.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    // Fills `cache` from storage. A missing store is an empty cache, not an
    // error.
    virtual bool load(BuildCache& cache, DiagnosticEngine& diag) = 0;
    virtual bool save(const BuildCache& cache, DiagnosticEngine& diag) = 0;
};

// Stores the cache as TOML, one table per unit under [units].
class TomlCacheStore : public CacheStore {
public:
    explicit TomlCacheStore(std::string path);

    bool load(BuildCache& cache, DiagnosticEngine& diag) override;
    bool save(const BuildCache& cache, DiagnosticEngine& diag) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace prism
