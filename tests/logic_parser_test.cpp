#include <gtest/gtest.h>

#include "lexer/logic_lexer.h"
#include "parser/expr_parser.h"
#include "parser/logic_parser.h"

#include <string>

using namespace prism;

namespace {

LogicSection parseLogic(const std::string& source, DiagnosticEngine& diag,
                        const std::string& unit = "pages/home") {
    diag.setEcho(false);
    LogicLexer lexer(source, SourceLocation{unit}, diag);
    return LogicParser(lexer.tokenize(), unit, diag).parse();
}

std::string parseAndPrint(const std::string& text) {
    DiagnosticEngine diag;
    diag.setEcho(false);
    auto e = ExprParser::parseString(text, SourceLocation{"u"}, diag);
    if (!e) return "<error>";
    return exprToString(*e);
}

} // namespace

// ─── Declarations ───────────────────────────────────────────────────

TEST(LogicParserTest, AllDeclarationKinds) {
    DiagnosticEngine diag;
    auto logic = parseLogic("import Card from \"./card\"\n"
                            "prop title: string\n"
                            "prop size: int = 3\n"
                            "state open: bool = false\n"
                            "state items\n"
                            "method toggle\n", diag);
    EXPECT_FALSE(diag.hasErrors());
    ASSERT_EQ(logic.decls.size(), 6u);

    const auto& import = std::get<decl::Import>(logic.decls[0].kind);
    EXPECT_EQ(import.name, "Card");
    EXPECT_EQ(import.path, "./card");
    EXPECT_EQ(import.unit, "pages/card");

    const auto& title = std::get<decl::Prop>(logic.decls[1].kind);
    EXPECT_EQ(title.type, "string");
    EXPECT_FALSE(title.default_value);

    const auto& size = std::get<decl::Prop>(logic.decls[2].kind);
    ASSERT_TRUE(size.default_value);
    EXPECT_EQ(exprToString(**size.default_value), "3");

    const auto& items = std::get<decl::State>(logic.decls[4].kind);
    EXPECT_EQ(items.type, "any");
    EXPECT_FALSE(items.initial);

    EXPECT_EQ(std::get<decl::Method>(logic.decls[5].kind).name, "toggle");
    EXPECT_EQ(logic.decls[5].loc.line, 6u);
}

TEST(LogicParserTest, SemicolonsAreOptionalSeparators) {
    DiagnosticEngine diag;
    auto logic = parseLogic("prop a: int; prop b: int;\n\n;", diag);
    EXPECT_FALSE(diag.hasErrors());
    EXPECT_EQ(logic.decls.size(), 2u);
}

TEST(LogicParserTest, CollectionDefaults) {
    DiagnosticEngine diag;
    auto logic = parseLogic("state tags: list = ['a', 'b']\nstate meta: map = {kind: 'x', n: 1}\n", diag);
    EXPECT_FALSE(diag.hasErrors());
    ASSERT_EQ(logic.decls.size(), 2u);
    const auto& tags = std::get<decl::State>(logic.decls[0].kind);
    EXPECT_EQ(exprToString(**tags.initial), "['a', 'b']");
}

TEST(LogicParserTest, RecoversAfterAnError) {
    DiagnosticEngine diag;
    auto logic = parseLogic("prop : int\nprop ok: int\nmethod\nmethod fine\n", diag);
    EXPECT_EQ(diag.errorCount(), 2);
    EXPECT_TRUE(diag.has(DiagCode::InvalidExpression));
    ASSERT_EQ(logic.decls.size(), 2u);
    EXPECT_EQ(std::get<decl::Prop>(logic.decls[0].kind).name, "ok");
    EXPECT_EQ(std::get<decl::Method>(logic.decls[1].kind).name, "fine");
}

TEST(LogicParserTest, UnknownStatement) {
    DiagnosticEngine diag;
    parseLogic("let x = 1\n", diag);
    EXPECT_TRUE(diag.hasErrors());
}

TEST(LogicParserTest, ImportNeedsAStringPath) {
    DiagnosticEngine diag;
    parseLogic("import Card from card\n", diag);
    EXPECT_TRUE(diag.hasErrors());
}

// ─── Import resolution ──────────────────────────────────────────────

TEST(ResolveImportPathTest, RelativeAndRootPaths) {
    EXPECT_EQ(resolveImportPath("pages/home", "./card"), "pages/card");
    EXPECT_EQ(resolveImportPath("pages/home", "../widgets/button.prism"), "widgets/button");
    EXPECT_EQ(resolveImportPath("pages/home", "layout/shell"), "layout/shell");
    EXPECT_EQ(resolveImportPath("app", "./nav"), "nav");
}

TEST(ScanImportsTest, FindsImportsWithoutFullParse) {
    std::string source =
        "<template><Card/><Nav/></template>\n"
        "<script>\n"
        "import Card from \"./card\"\n"
        "import Nav from \"../shared/nav\"\n"
        "import Card2 from \"./card\"\n"
        "prop broken: = \n"
        "</script>\n";
    auto imports = LogicParser::scanImports(source, "pages/home");
    ASSERT_EQ(imports.size(), 2u);
    EXPECT_EQ(imports[0], "pages/card");
    EXPECT_EQ(imports[1], "shared/nav");
}

TEST(ScanImportsTest, NoLogicSection) {
    EXPECT_TRUE(LogicParser::scanImports("<template><p/></template>", "a").empty());
}

// ─── Expressions ────────────────────────────────────────────────────

TEST(ExprParserTest, Precedence) {
    EXPECT_EQ(parseAndPrint("a + b * c"), "(a + (b * c))");
    EXPECT_EQ(parseAndPrint("a || b && c"), "(a || (b && c))");
    EXPECT_EQ(parseAndPrint("a < b == c"), "((a < b) == c)");
    EXPECT_EQ(parseAndPrint("ok ? 'y' : 'n'"), "(ok ? 'y' : 'n')");
}

TEST(ExprParserTest, PostfixAndFilters) {
    EXPECT_EQ(parseAndPrint("user.name | upper"), "user.name | upper");
    EXPECT_EQ(parseAndPrint("items[0].title"), "items[0].title");
    EXPECT_EQ(parseAndPrint("x | default('none')"), "x | default('none')");
}

TEST(ExprParserTest, RejectsTrailingTokens) {
    DiagnosticEngine diag;
    diag.setEcho(false);
    EXPECT_EQ(ExprParser::parseString("a b", SourceLocation{"u"}, diag), nullptr);
    EXPECT_TRUE(diag.has(DiagCode::InvalidExpression));
}

TEST(ExprParserTest, RejectsIncompleteExpressions) {
    DiagnosticEngine diag;
    diag.setEcho(false);
    EXPECT_EQ(ExprParser::parseString("a +", SourceLocation{"u"}, diag), nullptr);
    EXPECT_EQ(ExprParser::parseString("(a", SourceLocation{"u"}, diag), nullptr);
    EXPECT_EQ(ExprParser::parseString("", SourceLocation{"u"}, diag), nullptr);
}
