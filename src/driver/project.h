#pragma once

#include "build/build_cache.h"
#include "build/build_config.h"
#include "build/content_hash.h"
#include "build/orchestrator.h"
#include "common/diagnostics.h"

#include <optional>
#include <string>
#include <vector>

namespace prism {

// Command-line overrides for prism.toml.
struct BuildFlags {
    std::optional<bool> strict;
    std::optional<unsigned> jobs;
    bool no_cache = false;
    bool quiet = false;
};

class Project {
public:
    // Create a new project directory with prism.toml and a sample unit.
    static bool init(const std::string& dir, const std::string& name);

    // Compile every unit and write artifacts. Returns 0 on success.
    static int build(const std::string& dir, const BuildFlags& flags);

    // Compile every unit without writing artifacts or the cache.
    static int check(const std::string& dir, const BuildFlags& flags);

    // Rebuild whenever a unit changes. Does not return unless setup fails.
    static int watch(const std::string& dir, const BuildFlags& flags);

    // Remove the output directory.
    static int clean(const std::string& dir);

    // Every *.prism file under `sourceRoot`, sorted by unit identity.
    static std::vector<UnitSource> discover(const std::string& sourceRoot, DiagnosticEngine& diag);

private:
    static std::optional<BuildConfig> loadConfig(const std::string& dir, const BuildFlags& flags);
    static OrchestratorOptions optionsFor(const std::string& dir, const BuildConfig& config,
                                          const BuildFlags& flags);
    static void printReport(const BuildReport& report, bool quiet);
};

} // namespace prism
