#include "driver/project.h"
#include "build/cache_store.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace prism {

static const char* kConfigFile = "prism.toml";
static const char* kCacheFile = "cache.toml";

bool Project::init(const std::string& dir, const std::string& name) {
    fs::path projectDir = fs::path(dir) / name;

    if (fs::exists(projectDir)) {
        std::cerr << "error: directory '" << name << "' already exists\n";
        return false;
    }

    BuildConfig config;
    config.project.name = name;

    std::error_code ec;
    fs::create_directories(projectDir / config.project.source, ec);
    if (ec) {
        std::cerr << "error: cannot create '" << projectDir.string() << "': " << ec.message() << "\n";
        return false;
    }

    if (!config.save(projectDir.string())) {
        std::cerr << "error: cannot write " << kConfigFile << "\n";
        return false;
    }

    // Write src/app.prism
    {
        std::ofstream f(projectDir / config.project.source / "app.prism");
        f << "<template>\n"
          << "  <div class=\"greeting\">\n"
          << "    <h1>Hello, {{ name | upper }}!</h1>\n"
          << "    <p p-if=\"count > 0\">Clicked {{ count }} times</p>\n"
          << "    <button @click=\"increment\">Click</button>\n"
          << "  </div>\n"
          << "</template>\n"
          << "\n"
          << "<style>\n"
          << ".greeting h1 {\n"
          << "  color: #3b5bdb;\n"
          << "}\n"
          << "</style>\n"
          << "\n"
          << "<script>\n"
          << "prop name: string = \"world\"\n"
          << "state count: int = 0\n"
          << "method increment\n"
          << "</script>\n";
        if (!f) {
            std::cerr << "error: cannot write sample unit\n";
            return false;
        }
    }

    std::cout << "Created project '" << name << "'\n";
    return true;
}

std::vector<UnitSource> Project::discover(const std::string& sourceRoot, DiagnosticEngine& diag) {
    std::vector<UnitSource> units;
    std::error_code ec;
    if (!fs::is_directory(sourceRoot, ec)) {
        diag.error(DiagCode::Io, SourceLocation{sourceRoot}, "source directory not found");
        return units;
    }

    for (auto it = fs::recursive_directory_iterator(sourceRoot, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& path = it->path();
        if (!it->is_regular_file() || path.extension() != ".prism") continue;

        std::string id = fs::relative(path, sourceRoot).replace_extension().generic_string();
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            diag.error(DiagCode::Io, SourceLocation{id}, "cannot open " + path.string());
            continue;
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        units.push_back({id, path.string(), buf.str()});
    }
    if (ec) {
        diag.error(DiagCode::Io, SourceLocation{sourceRoot}, "cannot scan sources: " + ec.message());
    }

    std::sort(units.begin(), units.end(),
              [](const UnitSource& a, const UnitSource& b) { return a.id < b.id; });
    return units;
}

std::optional<BuildConfig> Project::loadConfig(const std::string& dir, const BuildFlags& flags) {
    DiagnosticEngine diag;
    auto config = BuildConfig::load(dir, diag);
    if (!config) return std::nullopt;

    if (flags.strict) config->build.strict = *flags.strict;
    if (flags.jobs) config->build.jobs = *flags.jobs;
    if (flags.no_cache) config->build.cache = false;
    return config;
}

OrchestratorOptions Project::optionsFor(const std::string& dir, const BuildConfig& config,
                                        const BuildFlags& flags) {
    OrchestratorOptions options;
    options.jobs = config.effectiveJobs();
    options.strict = config.build.strict;
    options.use_cache = config.build.cache && !flags.no_cache;
    options.out_dir = (fs::path(dir) / config.project.out).string();
    return options;
}

void Project::printReport(const BuildReport& report, bool quiet) {
    DiagnosticEngine printer;
    for (const auto& diag : report.diagnostics) {
        printer.print(diag);
    }
    if (quiet) return;

    for (const auto& unit : report.units) {
        switch (unit.status) {
            case UnitStatus::Compiled:  std::cout << "Compiled " << unit.unit << "\n"; break;
            case UnitStatus::Cached:    std::cout << "Cached " << unit.unit << "\n"; break;
            case UnitStatus::Failed:    std::cout << "Failed " << unit.unit << "\n"; break;
            case UnitStatus::Cancelled: std::cout << "Cancelled " << unit.unit << "\n"; break;
        }
    }
    std::cout << report.units.size() << " units: "
              << report.count(UnitStatus::Compiled) << " compiled, "
              << report.count(UnitStatus::Cached) << " cached, "
              << report.count(UnitStatus::Failed) << " failed\n";
}

int Project::build(const std::string& dir, const BuildFlags& flags) {
    auto config = loadConfig(dir, flags);
    if (!config) return 1;

    DiagnosticEngine diag;
    auto units = discover((fs::path(dir) / config->project.source).string(), diag);
    if (diag.hasErrors()) return 1;
    if (units.empty()) {
        std::cerr << "error: no .prism files found in " << config->project.source << "\n";
        return 1;
    }

    OrchestratorOptions options = optionsFor(dir, *config, flags);
    TomlCacheStore store((fs::path(options.out_dir) / kCacheFile).string());
    BuildCache cache;
    if (options.use_cache && !store.load(cache, diag)) {
        cache.clear();
    }

    ContentHasher hasher;
    BuildOrchestrator orchestrator(cache, hasher, options);
    BuildReport report = orchestrator.build(units);
    printReport(report, flags.quiet);

    if (!store.save(cache, diag)) return 1;
    return report.success() ? 0 : 1;
}

int Project::check(const std::string& dir, const BuildFlags& flags) {
    auto config = loadConfig(dir, flags);
    if (!config) return 1;

    DiagnosticEngine diag;
    auto units = discover((fs::path(dir) / config->project.source).string(), diag);
    if (diag.hasErrors()) return 1;

    OrchestratorOptions options = optionsFor(dir, *config, flags);
    options.use_cache = false;
    options.write_artifacts = false;

    BuildCache cache;
    ContentHasher hasher;
    BuildOrchestrator orchestrator(cache, hasher, options);
    BuildReport report = orchestrator.build(units);
    printReport(report, true);

    if (!flags.quiet) {
        std::cout << report.units.size() << " units checked, "
                  << report.count(UnitStatus::Failed) << " with errors\n";
    }
    return report.success() ? 0 : 1;
}

// ─── Watch ──────────────────────────────────────────────────────────

namespace {

using Snapshot = std::map<std::string, std::string>;    // unit -> text

Snapshot snapshotOf(const std::vector<UnitSource>& units) {
    Snapshot snap;
    for (const auto& unit : units) snap[unit.id] = unit.text;
    return snap;
}

// Units added, removed or edited between two snapshots.
std::vector<std::string> changedUnits(const Snapshot& before, const Snapshot& after) {
    std::vector<std::string> changed;
    for (const auto& [id, text] : after) {
        auto it = before.find(id);
        if (it == before.end() || it->second != text) changed.push_back(id);
    }
    for (const auto& [id, text] : before) {
        if (!after.count(id)) changed.push_back(id);
    }
    return changed;
}

} // namespace

int Project::watch(const std::string& dir, const BuildFlags& flags) {
    auto config = loadConfig(dir, flags);
    if (!config) return 1;

    const std::string sourceRoot = (fs::path(dir) / config->project.source).string();
    const auto interval = std::chrono::milliseconds(300);

    OrchestratorOptions options = optionsFor(dir, *config, flags);
    TomlCacheStore store((fs::path(options.out_dir) / kCacheFile).string());
    BuildCache cache;
    DiagnosticEngine diag;
    if (options.use_cache && !store.load(cache, diag)) {
        cache.clear();
    }

    ContentHasher hasher;
    BuildOrchestrator orchestrator(cache, hasher, options);

    std::cout << "Watching " << config->project.source << " (Ctrl+C to stop)\n";

    Snapshot built;
    bool first = true;
    while (true) {
        DiagnosticEngine scan;
        auto units = discover(sourceRoot, scan);
        Snapshot current = snapshotOf(units);

        if (first || !changedUnits(built, current).empty()) {
            first = false;
            auto pass = std::async(std::launch::async, [&] { return orchestrator.build(units); });

            // Cancel units edited again while the pass is still running.
            Snapshot seen = current;
            while (pass.wait_for(interval) != std::future_status::ready) {
                DiagnosticEngine rescan;
                Snapshot latest = snapshotOf(discover(sourceRoot, rescan));
                for (const auto& unit : changedUnits(seen, latest)) {
                    orchestrator.invalidate(unit);
                }
                seen = std::move(latest);
            }

            BuildReport report = pass.get();
            printReport(report, flags.quiet);
            if (!store.save(cache, diag)) return 1;
            built = std::move(current);
            continue;
        }

        std::this_thread::sleep_for(interval);
    }
}

int Project::clean(const std::string& dir) {
    auto config = loadConfig(dir, BuildFlags{});
    if (!config) return 1;

    fs::path out = fs::path(dir) / config->project.out;
    std::error_code ec;
    auto removed = fs::remove_all(out, ec);
    if (ec) {
        std::cerr << "error: cannot remove '" << out.string() << "': " << ec.message() << "\n";
        return 1;
    }
    std::cout << "Removed " << removed << " files from " << config->project.out << "\n";
    return 0;
}

} // namespace prism
