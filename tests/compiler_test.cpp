#include <gtest/gtest.h>

#include "driver/compiler.h"

#include <string>
#include <vector>

using namespace prism;

namespace {

struct CompileRun {
    DiagnosticEngine diag;
    CompileResult result;

    CompileRun() { diag.setEcho(false); }
};

void compileInto(CompileRun& run, const std::string& source, const DependencyMap& deps = {},
                 CompileOptions options = {}, const std::string& unit = "pages/home") {
    Compiler compiler(run.diag, options);
    run.result = compiler.compile(source, unit, "phome", deps);
}

ComponentInterface cardInterface() {
    ComponentInterface iface;
    iface.unit = "pages/card";
    iface.scope_token = "pcard";
    iface.props.push_back(PropInfo{"title", "string", true, ""});
    iface.slots = {""};
    return iface;
}

} // namespace

TEST(CompilerTest, CompilesCompleteUnit) {
    CompileRun run;
    compileInto(run,
        "<template><h1 class=\"t\">{{ title }}</h1></template>\n"
        "<style>.t { color: red; }</style>\n"
        "<script>prop title: string</script>\n");
    ASSERT_TRUE(run.result.ok());
    EXPECT_FALSE(run.result.cancelled);
    EXPECT_EQ(run.diag.errorCount(), 0);
    EXPECT_NE(run.result.css.find(".t[prism-scope=\"phome\"]"), std::string::npos);
    EXPECT_FALSE(run.result.header.empty());
}

TEST(CompilerTest, UnclosedElementKeepsStyle) {
    CompileRun run;
    compileInto(run,
        "<template><div><span></div></template>\n"
        "<style>.a { color: red; }</style>\n"
        "<script>state x = 1</script>\n");
    EXPECT_FALSE(run.result.ok());
    ASSERT_EQ(run.diag.count(DiagCode::UnclosedElement), 1);
    bool namesSpan = false;
    for (const auto& d : run.diag.diagnostics()) {
        if (d.code == DiagCode::UnclosedElement) {
            namesSpan = d.message.find("<span>") != std::string::npos;
        }
    }
    EXPECT_TRUE(namesSpan);
    ASSERT_TRUE(run.result.stylesheet.has_value());
    EXPECT_NE(run.result.css.find(".a[prism-scope=\"phome\"]"), std::string::npos);
    EXPECT_TRUE(run.result.header.empty());
}

TEST(CompilerTest, MissingStyleGivesEmptyCss) {
    CompileRun run;
    compileInto(run, "<template><p>hi</p></template><script>state x</script>");
    ASSERT_TRUE(run.result.ok());
    ASSERT_TRUE(run.result.stylesheet.has_value());
    EXPECT_TRUE(run.result.stylesheet->rules.empty());
    EXPECT_TRUE(run.result.css.empty());
}

TEST(CompilerTest, MissingLogicSection) {
    CompileRun run;
    compileInto(run, "<template><p>hi</p></template>");
    EXPECT_FALSE(run.result.ok());
    EXPECT_TRUE(run.diag.has(DiagCode::MissingLogicSection));
}

TEST(CompilerTest, BrokenLogicIsNotReportedAsMissing) {
    CompileRun run;
    compileInto(run, "<template><p>hi</p></template><script>state x = 'open</script>");
    EXPECT_FALSE(run.result.ok());
    EXPECT_TRUE(run.diag.hasErrors());
    EXPECT_FALSE(run.diag.has(DiagCode::MissingLogicSection));
}

TEST(CompilerTest, RequiredPropOfDependency) {
    const std::string source =
        "<template><Card>body</Card></template>\n"
        "<script>import Card from \"./card\"</script>\n";
    DependencyMap deps{{"pages/card", cardInterface()}};

    CompileRun run;
    compileInto(run, source, deps);
    EXPECT_FALSE(run.result.ok());
    ASSERT_EQ(run.diag.count(DiagCode::MissingRequiredProp), 1);
    EXPECT_NE(run.diag.diagnostics().front().message.find("title"), std::string::npos);
}

TEST(CompilerTest, FailedDependency) {
    CompileRun run;
    compileInto(run,
        "<template><Card title=\"x\"/></template>\n"
        "<script>import Card from \"./card\"</script>\n",
        DependencyMap{{"pages/card", std::nullopt}});
    EXPECT_FALSE(run.result.ok());
    EXPECT_TRUE(run.diag.has(DiagCode::DependencyFailed));
}

TEST(CompilerTest, StrictTurnsUnknownDirectiveIntoError) {
    const std::string source = "<template><p p-frob=\"x\">a</p></template><script>state x</script>";

    CompileRun lenient;
    compileInto(lenient, source);
    EXPECT_TRUE(lenient.result.ok());
    EXPECT_EQ(lenient.diag.warningCount(), 1);

    CompileRun strict;
    CompileOptions options;
    options.strict = true;
    compileInto(strict, source, {}, options);
    EXPECT_FALSE(strict.result.ok());
    EXPECT_TRUE(strict.diag.has(DiagCode::UnknownDirective));
}

TEST(CompilerTest, CheckpointCanAbandonUnit) {
    std::vector<std::string> seen;
    CompileRun run;
    Compiler compiler(run.diag);
    compiler.setCheckpoint([&](const std::string& stage) {
        seen.push_back(stage);
        return stage != "analyze";
    });
    run.result = compiler.compile("<template><p>a</p></template><script>state x</script>",
                                  "pages/home", "phome", {});
    EXPECT_TRUE(run.result.cancelled);
    EXPECT_FALSE(run.result.ok());
    EXPECT_EQ(seen, (std::vector<std::string>{"parse", "analyze"}));
}

TEST(CompilerTest, CheckpointSeesEveryStage) {
    std::vector<std::string> seen;
    CompileRun run;
    Compiler compiler(run.diag);
    compiler.setCheckpoint([&](const std::string& stage) {
        seen.push_back(stage);
        return true;
    });
    run.result = compiler.compile("<template><p>a</p></template><script>state x</script>",
                                  "pages/home", "phome", {});
    EXPECT_TRUE(run.result.ok());
    EXPECT_EQ(seen, (std::vector<std::string>{"parse", "analyze", "codegen"}));
}

TEST(CompilerTest, OutputDependsOnlyOnInputs) {
    const std::string source =
        "<template><ul><li p-for=\"x in xs\" :key=\"x\">{{x}}</li></ul></template>\n"
        "<style>ul li { margin: 0; }</style>\n"
        "<script>state xs = [1, 2]</script>\n";
    CompileRun a;
    CompileRun b;
    compileInto(a, source);
    compileInto(b, source);
    ASSERT_TRUE(a.result.ok());
    EXPECT_EQ(a.result.header, b.result.header);
    EXPECT_EQ(a.result.css, b.result.css);
}
