#pragma once

#include "build/build_cache.h"
#include "build/content_hash.h"
#include "build/dependency_graph.h"
#include "common/diagnostics.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace prism {

struct UnitSource {
    std::string id;     // "components/card"
    std::string path;   // file it was read from, for messages
    std::string text;
};

enum class UnitStatus {
    Compiled,
    Cached,
    Failed,
    Cancelled,
};

const char* unitStatusName(UnitStatus status);

struct UnitReport {
    std::string unit;
    UnitStatus status = UnitStatus::Failed;
    std::vector<std::string> artifacts;     // relative to the output directory
    std::vector<Diagnostic> diagnostics;
};

struct BuildReport {
    std::vector<UnitReport> units;          // sorted by unit identity
    std::vector<Diagnostic> diagnostics;    // everything, in unit order
    std::vector<std::string> compiled;      // units the pipeline ran for, sorted

    bool success() const;
    const UnitReport* find(const std::string& unit) const;
    size_t count(UnitStatus status) const;
    size_t count(DiagCode code) const;
};

struct OrchestratorOptions {
    unsigned jobs = 1;
    bool strict = false;
    bool use_cache = true;
    bool write_artifacts = true;    // off for `prism check`
    std::string out_dir;
};

// Called on worker threads as a unit enters each stage: "lex", "parse",
// "analyze", "codegen", "commit".
using StageHook = std::function<void(const std::string& unit, const std::string& stage)>;

// Runs a build pass over a set of units: hashes them, rejects import
// cycles, then compiles in dependency order on a worker pool, reusing
// cache entries whose unit and dependencies are unchanged.
class BuildOrchestrator {
public:
    BuildOrchestrator(BuildCache& cache, const ContentHasher& hasher, OrchestratorOptions options);

    BuildReport build(const std::vector<UnitSource>& sources);

    // Cancels `unit` and everything depending on it in the running pass.
    // Cancelled units commit neither artifacts nor cache entries. Outside a
    // pass the unit's cache entry is dropped instead.
    void invalidate(const std::string& unit);

    void setStageHook(StageHook hook) { hook_ = std::move(hook); }

private:
    struct Outcome {
        UnitReport report;
        std::optional<ComponentInterface> interface;
        bool ran_pipeline = false;
    };

    struct Pass {
        DependencyGraph graph;
        std::map<std::string, const UnitSource*> sources;
        std::map<std::string, std::string> hashes;
        std::map<std::string, std::string> scope_tokens;
        std::map<std::string, size_t> waiting;
        std::deque<std::string> ready;
        std::set<std::string> cancelled;
        std::map<std::string, UnitStatus> statuses;
        std::map<std::string, std::optional<ComponentInterface>> interfaces;
        std::map<std::string, UnitReport> reports;
        std::vector<std::string> compiled;
        size_t remaining = 0;
    };

    void pruneDeleted(const std::set<std::string>& present, std::vector<Diagnostic>& out);
    void workerLoop();
    Outcome processUnit(const std::string& unit);
    void finishUnit(const std::string& unit, Outcome outcome);
    bool isCancelled(const std::string& unit);
    void stage(const std::string& unit, const std::string& name);

    std::optional<Outcome> tryCache(const std::string& unit, const std::string& hash,
                                    const std::vector<std::string>& deps,
                                    const std::map<std::string, std::string>& depHashes,
                                    bool depsClean);

    bool writeTemp(const std::string& relative, const std::string& content, DiagnosticEngine& diag);
    bool publish(const std::vector<std::string>& artifacts, DiagnosticEngine& diag);
    void discard(const std::vector<std::string>& artifacts);
    void removeStale(const std::string& unit, const std::vector<std::string>& kept,
                     DiagnosticEngine& diag);

    BuildCache& cache_;
    const ContentHasher& hasher_;
    OrchestratorOptions options_;
    StageHook hook_;

    std::mutex mutex_;
    std::condition_variable cv_;
    Pass* pass_ = nullptr;
};

} // namespace prism
