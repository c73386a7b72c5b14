#include "build/build_config.h"

#include "toml++/toml.hpp"

#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;

namespace prism {

std::optional<BuildConfig> BuildConfig::load(const std::string& dir, DiagnosticEngine& diag) {
    fs::path path = fs::path(dir) / "prism.toml";
    BuildConfig config;
    if (!fs::exists(path)) return config;

    SourceLocation fileLoc{path.string(), 1, 1, 0};

    try {
        auto result = toml::parse_file(path.string());

        // [project]
        if (auto project = result["project"].as_table()) {
            config.project.name = (*project)["name"].value_or(config.project.name);
            config.project.source = (*project)["source"].value_or(config.project.source);
            config.project.out = (*project)["out"].value_or(config.project.out);
        }

        // [build]
        if (auto build = result["build"].as_table()) {
            int64_t jobs = (*build)["jobs"].value_or(int64_t{0});
            if (jobs < 0) {
                diag.error(DiagCode::Config, fileLoc, "[build] jobs must not be negative");
                return std::nullopt;
            }
            config.build.jobs = static_cast<unsigned>(jobs);
            config.build.strict = (*build)["strict"].value_or(config.build.strict);
            config.build.cache = (*build)["cache"].value_or(config.build.cache);
        }
    } catch (const toml::parse_error& err) {
        const auto& begin = err.source().begin;
        SourceLocation loc{path.string(), static_cast<uint32_t>(begin.line),
                           static_cast<uint32_t>(begin.column), 0};
        diag.error(DiagCode::Config, loc, std::string(err.description()));
        return std::nullopt;
    }

    if (config.project.source.empty() || config.project.out.empty()) {
        diag.error(DiagCode::Config, fileLoc, "[project] source and out must not be empty");
        return std::nullopt;
    }
    return config;
}

bool BuildConfig::save(const std::string& dir) const {
    fs::path path = fs::path(dir) / "prism.toml";

    toml::table root{
        {"project", toml::table{
            {"name", project.name},
            {"source", project.source},
            {"out", project.out},
        }},
        {"build", toml::table{
            {"jobs", static_cast<int64_t>(build.jobs)},
            {"strict", build.strict},
            {"cache", build.cache},
        }},
    };

    std::ofstream out(path);
    if (!out) return false;
    out << root << "\n";
    return out.good();
}

unsigned BuildConfig::effectiveJobs() const {
    if (build.jobs > 0) return build.jobs;
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

} // namespace prism
