#include <gtest/gtest.h>

#include "codegen/cpp_codegen.h"
#include "driver/compiler.h"

#include <string>

using namespace prism;

namespace {

CompileResult compileUnit(const std::string& source, const std::string& unit = "widgets/badge") {
    DiagnosticEngine diag;
    diag.setEcho(false);
    Compiler compiler(diag);
    return compiler.compile(source, unit, "pbadge01", {});
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

const char* kBadge =
    "<template>\n"
    "  <span class=\"badge\" :title=\"label\">{{ label | upper }}</span>\n"
    "  <b p-if=\"count > 0\">{{ count }}</b>\n"
    "  <i p-for=\"(t, n) in tags\" :key=\"t\">{{ n }}</i>\n"
    "  <slot/>\n"
    "</template>\n"
    "<script>\n"
    "prop label: string\n"
    "prop count: int = 0\n"
    "state tags: list = ['a']\n"
    "</script>\n";

} // namespace

TEST(CppCodegenTest, NamespaceForUnit) {
    EXPECT_EQ(CppCodegen::namespaceFor("widgets/badge"), "prism_gen::widgets::badge");
    EXPECT_EQ(CppCodegen::namespaceFor("my-app/2col"), "prism_gen::my_app::_2col");
    EXPECT_EQ(CppCodegen::namespaceFor("ui/class"), "prism_gen::ui::class_");
}

TEST(CppCodegenTest, FileName) {
    EXPECT_EQ(CppCodegen().fileName("widgets/badge"), "widgets/badge.render.hpp");
}

TEST(CppCodegenTest, HeaderShape) {
    auto result = compileUnit(kBadge);
    ASSERT_TRUE(result.ok());
    const std::string& header = result.header;

    EXPECT_TRUE(contains(header, "#pragma once"));
    EXPECT_TRUE(contains(header, "#include \"runtime/runtime.h\""));
    EXPECT_TRUE(contains(header, "namespace prism_gen::widgets::badge {"));
    EXPECT_TRUE(contains(header, "inline constexpr const char* kScopeToken = \"pbadge01\";"));
    EXPECT_TRUE(contains(header, "inline std::vector<prism::RenderNode> render(const prism::RenderInput& input)"));
    EXPECT_TRUE(contains(header, "//   prop label: string (required)"));
    EXPECT_TRUE(contains(header, "//   prop count: int = 0"));
    EXPECT_TRUE(contains(header, "//   slot (default)"));
}

TEST(CppCodegenTest, UsesRuntimeHelpers) {
    auto result = compileUnit(kBadge);
    ASSERT_TRUE(result.ok());
    const std::string& header = result.header;

    EXPECT_TRUE(contains(header, "prism::requireProp(input, \"label\")"));
    EXPECT_TRUE(contains(header, "prism::propOr(input, \"count\""));
    EXPECT_TRUE(contains(header, "prism::stateOr(input, \"tags\""));
    EXPECT_TRUE(contains(header, "prism::applyFilter(\"upper\""));
    EXPECT_TRUE(contains(header, "prism::iterate("));
    EXPECT_TRUE(contains(header, "prism::applyKey("));
    EXPECT_TRUE(contains(header, "prism::RenderNode::empty()"));
    EXPECT_TRUE(contains(header, "prism::findSlot(input, \"\")"));
    EXPECT_TRUE(contains(header, "\"prism-scope\""));
}

TEST(CppCodegenTest, OutputIsDeterministic) {
    auto first = compileUnit(kBadge);
    auto second = compileUnit(kBadge);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.header, second.header);
}

TEST(CppCodegenTest, StringLiteralsAreEscaped) {
    auto result = compileUnit("<template><p title='say \"hi\"'>a\\b</p></template><script>state s</script>");
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(contains(result.header, "std::string(\"say \\\"hi\\\"\")"));
    EXPECT_TRUE(contains(result.header, "\"a\\\\b\""));
}
