#include <gtest/gtest.h>

#include "driver/compiler.h"
#include "runtime/runtime.h"

#include "badge.render.hpp"
#include "list.render.hpp"

#include <fstream>
#include <sstream>
#include <string>

// The generated headers come from `prism build` over tests/fixtures/parity.
// Each case renders the same input through the in-process RenderProgram and
// through the compiled header and expects identical trees.

using namespace prism;

namespace {

std::string readFixture(const std::string& name) {
    std::ifstream in(std::string(PRISM_PARITY_SOURCE_DIR) + "/" + name);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class RenderParityTest : public ::testing::Test {
protected:
    void SetUp() override {
        diag_.setEcho(false);

        Compiler compiler(diag_);
        auto badge = compiler.compile(readFixture("badge.prism"), "badge",
                                      prism_gen::badge::kScopeToken, {});
        ASSERT_TRUE(badge.ok());
        DependencyMap deps{{"badge", badge.program->interface()}};
        auto list = compiler.compile(readFixture("list.prism"), "list",
                                     prism_gen::list::kScopeToken, deps);
        ASSERT_TRUE(list.ok());

        badge_ = std::move(badge.program);
        list_ = std::move(list.program);
    }

    void expectSameList(const RenderInput& input) {
        auto interpreted = list_->render(input);
        auto compiled = prism_gen::list::render(input);
        EXPECT_EQ(interpreted, compiled) << "interpreted:\n" << dumpRenderTree(interpreted)
                                         << "compiled:\n" << dumpRenderTree(compiled);
    }

    DiagnosticEngine diag_;
    std::optional<RenderProgram> badge_;
    std::optional<RenderProgram> list_;
};

Value item(int64_t id, const std::string& name, bool done) {
    return Value(Value::Map{{"id", Value(id)}, {"name", Value(name)}, {"done", Value(done)}});
}

} // namespace

TEST_F(RenderParityTest, Defaults) {
    expectSameList(RenderInput{});
}

TEST_F(RenderParityTest, KeyedLoopWithEveryBranch) {
    RenderInput input;
    input.props["title"] = Value("Tasks");
    input.props["tone"] = Value("loud");
    input.state["items"] = Value(Value::List{item(7, " write ", false), item(8, "test", true),
                                             item(9, "  ship", false)});
    input.state["count"] = Value(3);
    expectSameList(input);
}

TEST_F(RenderParityTest, MapLoopAndFilters) {
    RenderInput input;
    input.state["tags"] = Value(Value::Map{{"b", Value(Value::List{1, 2.5})}, {"a", Value()}});
    input.state["count"] = Value(-1);
    expectSameList(input);
}

TEST_F(RenderParityTest, SuppliedSlot) {
    RenderInput input;
    input.slots["footer"] = {RenderNode::textNode("custom")};
    expectSameList(input);
}

TEST_F(RenderParityTest, BadgeRequiresItsProp) {
    EXPECT_THROW(badge_->render(RenderInput{}), RenderError);
    EXPECT_THROW(prism_gen::badge::render(RenderInput{}), RenderError);

    RenderInput input;
    input.props["label"] = Value("new");
    input.slots[""] = {RenderNode::textNode("!")};
    EXPECT_EQ(badge_->render(input), prism_gen::badge::render(input));
}

TEST_F(RenderParityTest, SameRuntimeErrors) {
    RenderInput input;
    input.state["items"] = Value(42);
    EXPECT_THROW(list_->render(input), RenderError);
    EXPECT_THROW(prism_gen::list::render(input), RenderError);
}
