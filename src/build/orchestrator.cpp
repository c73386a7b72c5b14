#include "build/orchestrator.h"

#include "codegen/cpp_codegen.h"
#include "driver/compiler.h"
#include "parser/logic_parser.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;

namespace prism {

const char* unitStatusName(UnitStatus status) {
    switch (status) {
        case UnitStatus::Compiled:  return "compiled";
        case UnitStatus::Cached:    return "cached";
        case UnitStatus::Failed:    return "failed";
        case UnitStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ─── BuildReport ────────────────────────────────────────────────

bool BuildReport::success() const {
    for (const auto& unit : units) {
        if (unit.status == UnitStatus::Failed || unit.status == UnitStatus::Cancelled) return false;
    }
    return std::none_of(diagnostics.begin(), diagnostics.end(),
                        [](const Diagnostic& d) { return d.level == DiagLevel::Error; });
}

const UnitReport* BuildReport::find(const std::string& unit) const {
    for (const auto& report : units) {
        if (report.unit == unit) return &report;
    }
    return nullptr;
}

size_t BuildReport::count(UnitStatus status) const {
    return static_cast<size_t>(std::count_if(units.begin(), units.end(),
                                             [&](const UnitReport& r) { return r.status == status; }));
}

size_t BuildReport::count(DiagCode code) const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
                                             [&](const Diagnostic& d) { return d.code == code; }));
}

// ─── BuildOrchestrator ──────────────────────────────────────────

BuildOrchestrator::BuildOrchestrator(BuildCache& cache, const ContentHasher& hasher,
                                     OrchestratorOptions options)
    : cache_(cache), hasher_(hasher), options_(std::move(options)) {}

void BuildOrchestrator::pruneDeleted(const std::set<std::string>& present,
                                     std::vector<Diagnostic>& out) {
    for (const auto& unit : cache_.units()) {
        if (present.count(unit)) continue;
        auto entry = cache_.find(unit);
        cache_.erase(unit);
        if (!entry || !options_.write_artifacts) continue;
        for (const auto& artifact : entry->artifacts) {
            std::error_code ec;
            fs::remove(fs::path(options_.out_dir) / artifact, ec);
            if (ec) {
                out.push_back({DiagLevel::Warning, DiagCode::Io, SourceLocation{unit},
                               "cannot remove stale artifact '" + artifact + "': " + ec.message()});
            }
        }
    }
}

BuildReport BuildOrchestrator::build(const std::vector<UnitSource>& sources) {
    BuildReport report;
    Pass pass;

    std::set<std::string> present;
    for (const auto& source : sources) present.insert(source.id);
    pruneDeleted(present, report.diagnostics);

    auto failUnit = [&](const std::string& unit, std::vector<Diagnostic> diags) {
        UnitReport failed;
        failed.unit = unit;
        failed.status = UnitStatus::Failed;
        failed.diagnostics = std::move(diags);
        if (options_.write_artifacts) {
            DiagnosticEngine cleanup;
            cleanup.setEcho(false);
            removeStale(unit, {}, cleanup);
            for (const auto& d : cleanup.diagnostics()) failed.diagnostics.push_back(d);
        }
        pass.statuses[unit] = UnitStatus::Failed;
        pass.interfaces[unit] = std::nullopt;
        pass.reports[unit] = std::move(failed);
    };

    // ─── Hash and scan imports ──────────────────────────────────
    for (const auto& source : sources) {
        if (pass.sources.count(source.id)) continue;
        pass.sources[source.id] = &source;
        pass.graph.addUnit(source.id, LogicParser::scanImports(source.text, source.id));
        try {
            pass.hashes[source.id] = hasher_.hash(source.text);
            pass.scope_tokens[source.id] = hasher_.scopeToken(source.id);
        } catch (const std::runtime_error& err) {
            failUnit(source.id, {{DiagLevel::Error, DiagCode::Io, SourceLocation{source.id},
                                  std::string("cannot hash unit: ") + err.what()}});
        }
    }

    // ─── Cycles ─────────────────────────────────────────────────
    // One error per cycle, on its first member; the others get a note.
    for (const auto& cycle : pass.graph.findCycles()) {
        std::string members;
        for (const auto& unit : cycle) {
            if (!members.empty()) members += ", ";
            members += "'" + unit + "'";
        }
        for (size_t i = 0; i < cycle.size(); i++) {
            if (pass.reports.count(cycle[i])) continue;
            Diagnostic diag = i == 0
                ? Diagnostic{DiagLevel::Error, DiagCode::CircularDependency, SourceLocation{cycle[i]},
                             "circular import between " + members}
                : Diagnostic{DiagLevel::Note, DiagCode::None, SourceLocation{cycle[i]},
                             "part of the import cycle reported for '" + cycle[0] + "'"};
            failUnit(cycle[i], {diag});
        }
    }

    // ─── Schedule ───────────────────────────────────────────────
    std::vector<std::string> order(pass.graph.units());
    std::sort(order.begin(), order.end());
    for (const auto& unit : order) {
        if (pass.reports.count(unit)) continue;
        size_t waiting = 0;
        for (const auto& dep : pass.graph.imports(unit)) {
            if (pass.graph.contains(dep) && !pass.reports.count(dep)) waiting++;
        }
        pass.waiting[unit] = waiting;
        if (waiting == 0) pass.ready.push_back(unit);
        pass.remaining++;
    }

    if (pass.remaining > 0) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pass_ = &pass;
        }
        size_t workers = std::max<size_t>(1, std::min<size_t>(options_.jobs, pass.remaining));
        std::vector<std::thread> threads;
        for (size_t i = 0; i < workers; i++) {
            threads.emplace_back([this] { workerLoop(); });
        }
        for (auto& thread : threads) thread.join();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pass_ = nullptr;
        }
    }

    // ─── Report ─────────────────────────────────────────────────
    for (auto& [unit, unitReport] : pass.reports) {
        for (const auto& diag : unitReport.diagnostics) report.diagnostics.push_back(diag);
        report.units.push_back(std::move(unitReport));
    }
    report.compiled = std::move(pass.compiled);
    std::sort(report.compiled.begin(), report.compiled.end());
    return report;
}

void BuildOrchestrator::invalidate(const std::string& unit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pass_) {
        cache_.erase(unit);
        return;
    }
    if (!pass_->graph.contains(unit)) return;
    for (const auto& affected : pass_->graph.dependentClosure(unit)) {
        if (pass_->reports.count(affected)) {
            // Already finished this pass; make the next pass recompile it.
            cache_.erase(affected);
        } else {
            pass_->cancelled.insert(affected);
        }
    }
}

bool BuildOrchestrator::isCancelled(const std::string& unit) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pass_ && pass_->cancelled.count(unit) > 0;
}

void BuildOrchestrator::stage(const std::string& unit, const std::string& name) {
    if (hook_) hook_(unit, name);
}

// ─── Workers ────────────────────────────────────────────────────

void BuildOrchestrator::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return !pass_->ready.empty() || pass_->remaining == 0; });
        if (pass_->ready.empty()) return;

        std::string unit = pass_->ready.front();
        pass_->ready.pop_front();
        lock.unlock();

        Outcome outcome;
        try {
            outcome = processUnit(unit);
        } catch (const std::exception& err) {
            outcome = Outcome{};
            outcome.report.unit = unit;
            outcome.report.status = UnitStatus::Failed;
            outcome.report.diagnostics.push_back({DiagLevel::Error, DiagCode::None, SourceLocation{unit},
                                                  std::string("internal error: ") + err.what()});
        }

        lock.lock();
        finishUnit(unit, std::move(outcome));
    }
}

void BuildOrchestrator::finishUnit(const std::string& unit, Outcome outcome) {
    UnitStatus status = outcome.report.status;
    bool usable = status == UnitStatus::Compiled || status == UnitStatus::Cached;
    pass_->statuses[unit] = status;
    pass_->interfaces[unit] = usable ? std::move(outcome.interface) : std::nullopt;
    if (outcome.ran_pipeline) pass_->compiled.push_back(unit);
    pass_->reports[unit] = std::move(outcome.report);

    for (const auto& dependent : pass_->graph.dependents(unit)) {
        auto it = pass_->waiting.find(dependent);
        if (it == pass_->waiting.end() || it->second == 0) continue;
        if (--it->second == 0) pass_->ready.push_back(dependent);
    }
    pass_->remaining--;
    cv_.notify_all();
}

BuildOrchestrator::Outcome BuildOrchestrator::processUnit(const std::string& unit) {
    Outcome outcome;
    outcome.report.unit = unit;

    const UnitSource* source = nullptr;
    std::string hash, token;
    std::vector<std::string> deps;
    DependencyMap interfaces;
    std::map<std::string, std::string> depHashes;
    bool depsClean = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pass_->cancelled.count(unit)) {
            outcome.report.status = UnitStatus::Cancelled;
            return outcome;
        }
        source = pass_->sources.at(unit);
        hash = pass_->hashes.at(unit);
        token = pass_->scope_tokens.at(unit);
        for (const auto& dep : pass_->graph.imports(unit)) {
            if (!pass_->graph.contains(dep)) continue;
            deps.push_back(dep);
            interfaces[dep] = pass_->interfaces[dep];
            auto h = pass_->hashes.find(dep);
            depHashes[dep] = h != pass_->hashes.end() ? h->second : std::string();
            if (pass_->statuses[dep] != UnitStatus::Cached) depsClean = false;
        }
    }

    if (options_.use_cache) {
        if (auto hit = tryCache(unit, hash, deps, depHashes, depsClean)) return std::move(*hit);
    }

    DiagnosticEngine diag;
    diag.setEcho(false);

    stage(unit, "lex");
    if (isCancelled(unit)) {
        outcome.report.status = UnitStatus::Cancelled;
        return outcome;
    }

    Compiler compiler(diag, CompileOptions{options_.strict});
    compiler.setCheckpoint([&](const std::string& name) {
        stage(unit, name);
        return !isCancelled(unit);
    });
    outcome.ran_pipeline = true;
    CompileResult result = compiler.compile(source->text, unit, token, interfaces);
    if (result.cancelled) {
        outcome.report.status = UnitStatus::Cancelled;
        return outcome;
    }

    // Stage artifacts as temp files; they become visible only on publish.
    std::vector<std::string> artifacts;
    bool written = true;
    if (options_.write_artifacts) {
        if (result.ok()) {
            std::string header = CppCodegen().fileName(unit);
            if (writeTemp(header, result.header, diag)) artifacts.push_back(header);
            else written = false;
        }
        if (result.stylesheet) {
            std::string css = unit + ".css";
            if (writeTemp(css, result.css, diag)) artifacts.push_back(css);
            else written = false;
        }
    }

    stage(unit, "commit");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pass_->cancelled.count(unit)) {
            discard(artifacts);
            outcome.report.status = UnitStatus::Cancelled;
            return outcome;
        }
        if (!written) {
            discard(artifacts);
            artifacts.clear();
        } else if (!publish(artifacts, diag)) {
            artifacts.clear();
        }

        bool success = result.ok() && !diag.hasErrors();
        if (success && options_.write_artifacts) {
            CacheEntry entry;
            entry.unit = unit;
            entry.content_hash = hash;
            entry.artifacts = artifacts;
            entry.dependencies = depHashes;
            entry.interface = result.program->interface();
            cache_.commit(std::move(entry));
        }
        if (!success && options_.write_artifacts) removeStale(unit, artifacts, diag);
        outcome.report.status = success ? UnitStatus::Compiled : UnitStatus::Failed;
        if (success) outcome.interface = result.program->interface();
    }

    outcome.report.artifacts = std::move(artifacts);
    outcome.report.diagnostics = diag.diagnostics();
    return outcome;
}

std::optional<BuildOrchestrator::Outcome> BuildOrchestrator::tryCache(
        const std::string& unit, const std::string& hash, const std::vector<std::string>& deps,
        const std::map<std::string, std::string>& depHashes, bool depsClean) {
    if (!depsClean) return std::nullopt;
    auto entry = cache_.find(unit);
    if (!entry || entry->content_hash != hash) return std::nullopt;
    if (entry->dependencies != depHashes || entry->dependencies.size() != deps.size()) return std::nullopt;
    if (options_.write_artifacts) {
        for (const auto& artifact : entry->artifacts) {
            if (!fs::exists(fs::path(options_.out_dir) / artifact)) return std::nullopt;
        }
    }

    Outcome outcome;
    outcome.report.unit = unit;
    outcome.report.status = UnitStatus::Cached;
    outcome.report.artifacts = entry->artifacts;
    outcome.interface = entry->interface;
    return outcome;
}

// ─── Artifacts ──────────────────────────────────────────────────

static fs::path tempPath(const fs::path& target) {
    return fs::path(target.string() + ".tmp");
}

bool BuildOrchestrator::writeTemp(const std::string& relative, const std::string& content,
                                  DiagnosticEngine& diag) {
    fs::path target = fs::path(options_.out_dir) / relative;
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        diag.error(DiagCode::Io, SourceLocation{relative},
                   "cannot create '" + target.parent_path().string() + "': " + ec.message());
        return false;
    }
    std::ofstream out(tempPath(target), std::ios::binary | std::ios::trunc);
    if (!out) {
        diag.error(DiagCode::Io, SourceLocation{relative}, "cannot write '" + target.string() + "'");
        return false;
    }
    out << content;
    out.close();
    if (!out) {
        diag.error(DiagCode::Io, SourceLocation{relative}, "cannot write '" + target.string() + "'");
        return false;
    }
    return true;
}

bool BuildOrchestrator::publish(const std::vector<std::string>& artifacts, DiagnosticEngine& diag) {
    bool ok = true;
    for (const auto& relative : artifacts) {
        fs::path target = fs::path(options_.out_dir) / relative;
        std::error_code ec;
        fs::rename(tempPath(target), target, ec);
        if (ec) {
            diag.error(DiagCode::Io, SourceLocation{relative},
                       "cannot replace '" + target.string() + "': " + ec.message());
            ok = false;
        }
    }
    return ok;
}

// A failed unit keeps only what this pass produced for it. Its previous
// render header and any artifact it no longer produces are removed, and
// its cache entry is dropped.
void BuildOrchestrator::removeStale(const std::string& unit, const std::vector<std::string>& kept,
                                    DiagnosticEngine& diag) {
    std::set<std::string> stale;
    stale.insert(CppCodegen().fileName(unit));
    if (auto entry = cache_.find(unit)) {
        stale.insert(entry->artifacts.begin(), entry->artifacts.end());
    }
    cache_.erase(unit);

    for (const auto& relative : stale) {
        if (std::find(kept.begin(), kept.end(), relative) != kept.end()) continue;
        std::error_code ec;
        fs::remove(fs::path(options_.out_dir) / relative, ec);
        if (ec) {
            diag.warning(DiagCode::Io, SourceLocation{unit},
                         "cannot remove stale artifact '" + relative + "': " + ec.message());
        }
    }
}

void BuildOrchestrator::discard(const std::vector<std::string>& artifacts) {
    for (const auto& relative : artifacts) {
        std::error_code ec;
        fs::remove(tempPath(fs::path(options_.out_dir) / relative), ec);
    }
}

} // namespace prism
