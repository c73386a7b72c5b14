#include <gtest/gtest.h>

#include "build/orchestrator.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace prism;

namespace {

const char* kCard =
    "<template><div class=\"card\"><h2>{{ title }}</h2><slot/></div></template>\n"
    "<style>.card { padding: 4px; }</style>\n"
    "<script>prop title: string</script>\n";

const char* kApp =
    "<template><Card title=\"Hi\"><p>{{ body }}</p></Card></template>\n"
    "<script>\n"
    "import Card from \"./card\"\n"
    "state body = 'text'\n"
    "</script>\n";

const char* kLone =
    "<template><p>{{ n }}</p></template>\n"
    "<script>state n = 1</script>\n";

const char* kBroken =
    "<template><div><span></div></template>\n"
    "<style>.x { color: red; }</style>\n"
    "<script>state n = 1</script>\n";

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        out_ = fs::temp_directory_path() /
               ("prism-orchestrator-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
        fs::create_directories(out_);
        options_.out_dir = out_.string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(out_, ec);
    }

    static UnitSource unit(const std::string& id, const std::string& text) {
        return UnitSource{id, id + ".prism", text};
    }

    BuildReport run(const std::vector<UnitSource>& sources) {
        BuildOrchestrator orchestrator(cache_, hasher_, options_);
        return orchestrator.build(sources);
    }

    std::string read(const std::string& rel) const {
        std::ifstream in(out_ / rel, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    bool exists(const std::string& rel) const { return fs::exists(out_ / rel); }

    fs::path out_;
    BuildCache cache_;
    ContentHasher hasher_;
    OrchestratorOptions options_;
};

} // namespace

TEST_F(OrchestratorTest, BuildsInDependencyOrder) {
    auto report = run({unit("app", kApp), unit("card", kCard)});
    ASSERT_TRUE(report.success());
    EXPECT_EQ(report.compiled, (std::vector<std::string>{"app", "card"}));
    EXPECT_EQ(report.count(UnitStatus::Compiled), 2u);
    EXPECT_TRUE(exists("card.render.hpp"));
    EXPECT_TRUE(exists("card.css"));
    EXPECT_TRUE(exists("app.render.hpp"));
    EXPECT_TRUE(exists("app.css"));
    EXPECT_FALSE(exists("card.render.hpp.tmp"));
    EXPECT_EQ(cache_.size(), 2u);
}

TEST_F(OrchestratorTest, SecondBuildIsFullyCached) {
    std::vector<UnitSource> sources{unit("app", kApp), unit("card", kCard)};
    ASSERT_TRUE(run(sources).success());
    std::string header = read("app.render.hpp");
    std::string css = read("card.css");

    auto second = run(sources);
    EXPECT_TRUE(second.success());
    EXPECT_TRUE(second.compiled.empty());
    EXPECT_EQ(second.count(UnitStatus::Cached), 2u);
    EXPECT_EQ(read("app.render.hpp"), header);
    EXPECT_EQ(read("card.css"), css);
}

TEST_F(OrchestratorTest, ChangedDependencyRecompilesDependents) {
    ASSERT_TRUE(run({unit("app", kApp), unit("card", kCard), unit("lone", kLone)}).success());

    std::string edited = std::string(kCard) + "\n";
    auto report = run({unit("app", kApp), unit("card", edited), unit("lone", kLone)});
    EXPECT_TRUE(report.success());
    EXPECT_EQ(report.compiled, (std::vector<std::string>{"app", "card"}));
    ASSERT_NE(report.find("lone"), nullptr);
    EXPECT_EQ(report.find("lone")->status, UnitStatus::Cached);
}

TEST_F(OrchestratorTest, MissingArtifactForcesRecompile) {
    ASSERT_TRUE(run({unit("lone", kLone)}).success());
    fs::remove(out_ / "lone.render.hpp");
    auto report = run({unit("lone", kLone)});
    EXPECT_EQ(report.compiled, (std::vector<std::string>{"lone"}));
    EXPECT_TRUE(exists("lone.render.hpp"));
}

TEST_F(OrchestratorTest, CycleIsReportedOnce) {
    const char* a = "<template><B/></template><script>import B from \"./b\"</script>";
    const char* b = "<template><A/></template><script>import A from \"./a\"</script>";
    auto report = run({unit("a", a), unit("b", b), unit("lone", kLone)});

    EXPECT_FALSE(report.success());
    EXPECT_EQ(report.count(DiagCode::CircularDependency), 1u);
    EXPECT_EQ(report.find("a")->status, UnitStatus::Failed);
    EXPECT_EQ(report.find("b")->status, UnitStatus::Failed);
    EXPECT_EQ(report.find("lone")->status, UnitStatus::Compiled);
    EXPECT_FALSE(exists("a.render.hpp"));
    EXPECT_FALSE(exists("b.render.hpp"));
}

TEST_F(OrchestratorTest, FailureDoesNotStopIndependentUnits) {
    auto report = run({unit("broken", kBroken), unit("lone", kLone)});
    EXPECT_FALSE(report.success());
    EXPECT_EQ(report.find("broken")->status, UnitStatus::Failed);
    EXPECT_EQ(report.find("lone")->status, UnitStatus::Compiled);
    EXPECT_EQ(report.count(DiagCode::UnclosedElement), 1u);

    // The style section was valid, so its stylesheet is still produced.
    EXPECT_TRUE(exists("broken.css"));
    EXPECT_FALSE(exists("broken.render.hpp"));
    EXPECT_FALSE(cache_.find("broken"));
}

TEST_F(OrchestratorTest, FailingUnitRemovesItsOldHeader) {
    ASSERT_TRUE(run({unit("broken", kLone)}).success());
    ASSERT_TRUE(exists("broken.render.hpp"));
    ASSERT_TRUE(cache_.find("broken"));

    auto report = run({unit("broken", kBroken)});
    EXPECT_EQ(report.find("broken")->status, UnitStatus::Failed);
    EXPECT_FALSE(exists("broken.render.hpp"));
    EXPECT_TRUE(exists("broken.css"));
    EXPECT_FALSE(cache_.find("broken"));

    // Fixing the unit brings the header back.
    EXPECT_TRUE(run({unit("broken", kLone)}).success());
    EXPECT_TRUE(exists("broken.render.hpp"));
}

TEST_F(OrchestratorTest, UnitsJoiningACycleLoseTheirArtifacts) {
    const char* a = "<template><B/></template><script>import B from \"./b\"</script>";
    const char* b = "<template><p>b</p></template><style>p { margin: 0; }</style><script>state n</script>";
    const char* bCyclic = "<template><A/></template><script>import A from \"./a\"</script>";
    ASSERT_TRUE(run({unit("a", a), unit("b", b)}).success());
    ASSERT_TRUE(exists("b.css"));

    auto report = run({unit("a", a), unit("b", bCyclic)});
    EXPECT_EQ(report.count(DiagCode::CircularDependency), 1u);
    EXPECT_FALSE(exists("a.render.hpp"));
    EXPECT_FALSE(exists("b.render.hpp"));
    EXPECT_FALSE(exists("b.css"));
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(OrchestratorTest, FailedDependencyFailsDependent) {
    std::string badCard = "<template><div></template><script>prop title: string</script>";
    auto report = run({unit("app", kApp), unit("card", badCard)});
    EXPECT_EQ(report.find("card")->status, UnitStatus::Failed);
    EXPECT_EQ(report.find("app")->status, UnitStatus::Failed);
    EXPECT_EQ(report.count(DiagCode::DependencyFailed), 1u);
}

TEST_F(OrchestratorTest, InvalidateDuringPassCancelsClosure) {
    std::vector<UnitSource> sources{unit("app", kApp), unit("card", kCard), unit("lone", kLone)};
    BuildOrchestrator orchestrator(cache_, hasher_, options_);
    orchestrator.setStageHook([&](const std::string& id, const std::string& stage) {
        if (id == "card" && stage == "analyze") orchestrator.invalidate("card");
    });
    auto report = orchestrator.build(sources);

    EXPECT_EQ(report.find("card")->status, UnitStatus::Cancelled);
    EXPECT_EQ(report.find("app")->status, UnitStatus::Cancelled);
    EXPECT_EQ(report.find("lone")->status, UnitStatus::Compiled);
    EXPECT_FALSE(report.success());
    EXPECT_FALSE(cache_.find("card"));
    EXPECT_FALSE(cache_.find("app"));
    EXPECT_FALSE(exists("card.css"));
    EXPECT_FALSE(exists("app.render.hpp"));
}

TEST_F(OrchestratorTest, InvalidateAtCommitDiscardsStagedFiles) {
    BuildOrchestrator orchestrator(cache_, hasher_, options_);
    orchestrator.setStageHook([&](const std::string& id, const std::string& stage) {
        if (id == "lone" && stage == "commit") orchestrator.invalidate("lone");
    });
    auto report = orchestrator.build({unit("lone", kLone)});

    EXPECT_EQ(report.find("lone")->status, UnitStatus::Cancelled);
    EXPECT_FALSE(exists("lone.render.hpp"));
    EXPECT_FALSE(exists("lone.render.hpp.tmp"));
    EXPECT_FALSE(exists("lone.css.tmp"));
    EXPECT_FALSE(cache_.find("lone"));
}

TEST_F(OrchestratorTest, InvalidateOutsidePassDropsEntry) {
    ASSERT_TRUE(run({unit("lone", kLone)}).success());
    BuildOrchestrator orchestrator(cache_, hasher_, options_);
    orchestrator.invalidate("lone");
    EXPECT_FALSE(cache_.find("lone"));

    auto report = orchestrator.build({unit("lone", kLone)});
    EXPECT_EQ(report.compiled, (std::vector<std::string>{"lone"}));
}

TEST_F(OrchestratorTest, DeletedUnitIsPruned) {
    ASSERT_TRUE(run({unit("card", kCard), unit("lone", kLone)}).success());
    ASSERT_TRUE(exists("card.css"));

    auto report = run({unit("lone", kLone)});
    EXPECT_TRUE(report.success());
    EXPECT_FALSE(cache_.find("card"));
    EXPECT_FALSE(exists("card.css"));
    EXPECT_FALSE(exists("card.render.hpp"));
}

TEST_F(OrchestratorTest, CheckModeWritesNothing) {
    options_.write_artifacts = false;
    options_.use_cache = false;
    auto report = run({unit("app", kApp), unit("card", kCard)});
    EXPECT_TRUE(report.success());
    EXPECT_FALSE(exists("app.render.hpp"));
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(OrchestratorTest, ParallelBuildMatchesSerial) {
    std::vector<UnitSource> sources;
    sources.push_back(unit("card", kCard));
    for (int i = 0; i < 8; i++) {
        sources.push_back(unit("page" + std::to_string(i), kApp));
    }

    options_.jobs = 4;
    auto report = run(sources);
    ASSERT_TRUE(report.success());
    EXPECT_EQ(report.compiled.size(), 9u);
    std::string parallel = read("page3.render.hpp");

    fs::remove_all(out_);
    cache_.clear();
    options_.jobs = 1;
    ASSERT_TRUE(run(sources).success());
    EXPECT_EQ(read("page3.render.hpp"), parallel);
}
