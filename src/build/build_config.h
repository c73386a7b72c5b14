#pragma once

#include "common/diagnostics.h"

#include <optional>
#include <string>

namespace prism {

struct ProjectInfo {
    std::string name = "prism-project";
    std::string source = "src";     // unit root, relative to the project dir
    std::string out = "build";      // artifact directory, relative to the project dir
};

struct BuildSettings {
    unsigned jobs = 0;      // 0 = hardware concurrency
    bool strict = false;    // unknown directives are errors
    bool cache = true;
};

// prism.toml
struct BuildConfig {
    ProjectInfo project;
    BuildSettings build;

    // Defaults when the file is missing. Parse and validation failures are
    // reported as Config diagnostics and yield nullopt.
    static std::optional<BuildConfig> load(const std::string& dir, DiagnosticEngine& diag);
    bool save(const std::string& dir) const;

    unsigned effectiveJobs() const;
};

} // namespace prism
