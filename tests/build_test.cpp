#include <gtest/gtest.h>

#include "build/build_cache.h"
#include "build/build_config.h"
#include "build/cache_store.h"
#include "build/content_hash.h"
#include "build/dependency_graph.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace prism;

namespace {

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("prism-build-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }

    void write(const std::string& rel, const std::string& text) const {
        fs::path p = path_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p) << text;
    }

private:
    fs::path path_;
};

DiagnosticEngine quietEngine() {
    DiagnosticEngine diag;
    diag.setEcho(false);
    return diag;
}

} // namespace

// ─── DependencyGraph ────────────────────────────────────────────────

TEST(DependencyGraphTest, DependentsAndClosure) {
    DependencyGraph graph;
    graph.addUnit("app", {"layout", "card"});
    graph.addUnit("layout", {"card"});
    graph.addUnit("card", {});
    graph.addUnit("other", {});

    EXPECT_EQ(graph.dependents("card"), (std::vector<std::string>{"app", "layout"}));
    EXPECT_EQ(graph.dependentClosure("card"), (std::set<std::string>{"app", "card", "layout"}));
    EXPECT_EQ(graph.dependentClosure("other"), (std::set<std::string>{"other"}));
    EXPECT_TRUE(graph.findCycles().empty());
}

TEST(DependencyGraphTest, FindsCycles) {
    DependencyGraph graph;
    graph.addUnit("b", {"a"});
    graph.addUnit("a", {"b"});
    graph.addUnit("self", {"self"});
    graph.addUnit("c", {"a"});

    auto cycles = graph.findCycles();
    ASSERT_EQ(cycles.size(), 2u);
    EXPECT_EQ(cycles[0], (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(cycles[1], (std::vector<std::string>{"self"}));
}

TEST(DependencyGraphTest, KeepsImportsOfUnknownUnits) {
    DependencyGraph graph;
    graph.addUnit("app", {"missing"});
    EXPECT_FALSE(graph.contains("missing"));
    EXPECT_EQ(graph.imports("app"), (std::vector<std::string>{"missing"}));
    EXPECT_TRUE(graph.findCycles().empty());
}

// ─── ContentHasher ──────────────────────────────────────────────────

TEST(ContentHasherTest, MatchesGitBlobIds) {
    ContentHasher hasher;
    EXPECT_EQ(hasher.hash(""), "e69de29bb2d1d6434b8b29ae775ad8c2e48c5391");
    EXPECT_EQ(hasher.hash("hello\n"), "ce013625030ba8dba906f756967f9e9ca394464a");
}

TEST(ContentHasherTest, ScopeTokens) {
    ContentHasher hasher;
    std::string token = hasher.scopeToken("pages/home");
    ASSERT_EQ(token.size(), 9u);
    EXPECT_EQ(token[0], 'p');
    EXPECT_EQ(token, hasher.scopeToken("pages/home"));
    EXPECT_NE(token, hasher.scopeToken("pages/about"));
    EXPECT_EQ(token.substr(1), hasher.hash("pages/home").substr(0, 8));
}

// ─── BuildConfig ────────────────────────────────────────────────────

TEST(BuildConfigTest, DefaultsWithoutFile) {
    TempDir dir;
    auto diag = quietEngine();
    auto config = BuildConfig::load(dir.path().string(), diag);
    ASSERT_TRUE(config);
    EXPECT_EQ(config->project.source, "src");
    EXPECT_EQ(config->project.out, "build");
    EXPECT_TRUE(config->build.cache);
    EXPECT_GE(config->effectiveJobs(), 1u);
}

TEST(BuildConfigTest, SaveThenLoad) {
    TempDir dir;
    BuildConfig config;
    config.project.name = "site";
    config.project.out = "dist";
    config.build.jobs = 3;
    config.build.strict = true;
    ASSERT_TRUE(config.save(dir.path().string()));

    auto diag = quietEngine();
    auto loaded = BuildConfig::load(dir.path().string(), diag);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->project.name, "site");
    EXPECT_EQ(loaded->project.out, "dist");
    EXPECT_EQ(loaded->build.jobs, 3u);
    EXPECT_TRUE(loaded->build.strict);
    EXPECT_EQ(loaded->effectiveJobs(), 3u);
}

TEST(BuildConfigTest, RejectsBadToml) {
    TempDir dir;
    dir.write("prism.toml", "[project\nname = 1\n");
    auto diag = quietEngine();
    EXPECT_FALSE(BuildConfig::load(dir.path().string(), diag));
    EXPECT_TRUE(diag.has(DiagCode::Config));
}

TEST(BuildConfigTest, RejectsNegativeJobs) {
    TempDir dir;
    dir.write("prism.toml", "[build]\njobs = -2\n");
    auto diag = quietEngine();
    EXPECT_FALSE(BuildConfig::load(dir.path().string(), diag));
    EXPECT_EQ(diag.count(DiagCode::Config), 1);
}

// ─── BuildCache / TomlCacheStore ────────────────────────────────────

namespace {

CacheEntry sampleEntry() {
    CacheEntry entry;
    entry.unit = "pages/card";
    entry.content_hash = "0123456789abcdef0123456789abcdef01234567";
    entry.artifacts = {"pages/card.render.hpp", "pages/card.css"};
    entry.dependencies = {{"ui/icon", "89abcdef0123456789abcdef0123456789abcdef"}};
    entry.interface.unit = "pages/card";
    entry.interface.scope_token = "p01234567";
    entry.interface.props.push_back(PropInfo{"title", "string", true, ""});
    entry.interface.props.push_back(PropInfo{"size", "int", false, "2"});
    entry.interface.slots = {"", "footer"};
    return entry;
}

} // namespace

TEST(BuildCacheTest, CommitFindErase) {
    BuildCache cache;
    EXPECT_FALSE(cache.find("pages/card"));
    cache.commit(sampleEntry());
    ASSERT_TRUE(cache.find("pages/card"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.erase("pages/card"));
    EXPECT_FALSE(cache.erase("pages/card"));
    EXPECT_EQ(cache.size(), 0u);
}

TEST(TomlCacheStoreTest, PersistsEntries) {
    TempDir dir;
    std::string path = (dir.path() / "out" / "cache.toml").string();
    auto diag = quietEngine();

    BuildCache cache;
    cache.commit(sampleEntry());
    TomlCacheStore store(path);
    ASSERT_TRUE(store.save(cache, diag));

    BuildCache restored;
    ASSERT_TRUE(store.load(restored, diag));
    auto entry = restored.find("pages/card");
    ASSERT_TRUE(entry);
    CacheEntry expected = sampleEntry();
    EXPECT_EQ(entry->content_hash, expected.content_hash);
    EXPECT_EQ(entry->artifacts, expected.artifacts);
    EXPECT_EQ(entry->dependencies, expected.dependencies);
    EXPECT_EQ(entry->interface, expected.interface);
}

TEST(TomlCacheStoreTest, MissingFileIsEmptyCache) {
    TempDir dir;
    auto diag = quietEngine();
    BuildCache cache;
    TomlCacheStore store((dir.path() / "cache.toml").string());
    EXPECT_TRUE(store.load(cache, diag));
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(diag.hasErrors());
}

TEST(TomlCacheStoreTest, CorruptFileIsIgnored) {
    TempDir dir;
    dir.write("cache.toml", "units = [[[");
    auto diag = quietEngine();
    BuildCache cache;
    TomlCacheStore store((dir.path() / "cache.toml").string());
    EXPECT_FALSE(store.load(cache, diag));
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(diag.warningCount(), 1);
}
