#include "build/cache_store.h"

#include "toml++/toml.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace prism {

static constexpr int64_t kCacheFormat = 1;

TomlCacheStore::TomlCacheStore(std::string path) : path_(std::move(path)) {}

static std::vector<std::string> stringArray(const toml::node_view<const toml::node>& node) {
    std::vector<std::string> result;
    if (auto arr = node.as_array()) {
        for (const auto& el : *arr) {
            if (auto s = el.value<std::string>()) result.push_back(*s);
        }
    }
    return result;
}

bool TomlCacheStore::load(BuildCache& cache, DiagnosticEngine& diag) {
    if (!fs::exists(path_)) return true;

    SourceLocation loc{path_, 1, 1, 0};
    try {
        const toml::table root = toml::parse_file(path_);

        if (root["format"].value_or(int64_t{0}) != kCacheFormat) {
            diag.warning(DiagCode::Io, loc, "ignoring build cache written by another prism version");
            return false;
        }

        auto units = root["units"].as_table();
        if (!units) return true;

        for (const auto& [key, node] : *units) {
            auto tbl = node.as_table();
            if (!tbl) continue;

            CacheEntry entry;
            entry.unit = std::string(key.str());
            entry.content_hash = (*tbl)["hash"].value_or(std::string(""));
            entry.artifacts = stringArray((*tbl)["artifacts"]);

            if (auto deps = (*tbl)["dependencies"].as_table()) {
                for (const auto& [dep, hash] : *deps) {
                    entry.dependencies[std::string(dep.str())] = hash.value_or(std::string(""));
                }
            }

            entry.interface.unit = entry.unit;
            entry.interface.scope_token = (*tbl)["scope_token"].value_or(std::string(""));
            entry.interface.slots = stringArray((*tbl)["slots"]);
            if (auto props = (*tbl)["props"].as_array()) {
                for (const auto& el : *props) {
                    auto prop = el.as_table();
                    if (!prop) continue;
                    PropInfo info;
                    info.name = (*prop)["name"].value_or(std::string(""));
                    info.type = (*prop)["type"].value_or(std::string("any"));
                    info.required = (*prop)["required"].value_or(true);
                    info.default_value = (*prop)["default"].value_or(std::string(""));
                    entry.interface.props.push_back(std::move(info));
                }
            }

            if (entry.content_hash.empty()) continue;
            cache.commit(std::move(entry));
        }
        return true;
    } catch (const toml::parse_error& err) {
        diag.warning(DiagCode::Io, loc,
                     "ignoring unreadable build cache: " + std::string(err.description()));
        return false;
    }
}

bool TomlCacheStore::save(const BuildCache& cache, DiagnosticEngine& diag) {
    toml::table units;
    for (const auto& [unit, entry] : cache.snapshot()) {
        toml::array artifacts;
        for (const auto& artifact : entry.artifacts) artifacts.push_back(artifact);

        toml::table deps;
        for (const auto& [dep, hash] : entry.dependencies) deps.insert_or_assign(dep, hash);

        toml::array slots;
        for (const auto& slot : entry.interface.slots) slots.push_back(slot);

        toml::array props;
        for (const auto& prop : entry.interface.props) {
            props.push_back(toml::table{
                {"name", prop.name},
                {"type", prop.type},
                {"required", prop.required},
                {"default", prop.default_value},
            });
        }

        units.insert_or_assign(unit, toml::table{
            {"hash", entry.content_hash},
            {"artifacts", std::move(artifacts)},
            {"dependencies", std::move(deps)},
            {"scope_token", entry.interface.scope_token},
            {"slots", std::move(slots)},
            {"props", std::move(props)},
        });
    }

    toml::table root{
        {"format", kCacheFormat},
        {"units", std::move(units)},
    };

    SourceLocation loc{path_, 1, 1, 0};
    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);

    // Write-then-rename so a crash never leaves a torn cache file.
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp);
        if (!out) {
            diag.error(DiagCode::Io, loc, "cannot write build cache " + tmp.string());
            return false;
        }
        out << root << "\n";
        if (!out.good()) {
            diag.error(DiagCode::Io, loc, "failed writing build cache " + tmp.string());
            return false;
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        diag.error(DiagCode::Io, loc, "cannot replace build cache: " + ec.message());
        return false;
    }
    return true;
}

} // namespace prism
