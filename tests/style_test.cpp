#include <gtest/gtest.h>

#include "lexer/style_lexer.h"
#include "style/css_emitter.h"
#include "style/selector_scoper.h"
#include "style/style_parser.h"

#include <string>

using namespace prism;

namespace {

const std::string kPred = "[prism-scope=\"c1\"]";

std::optional<std::string> scoped(const std::string& selector) {
    DiagnosticEngine diag;
    diag.setEcho(false);
    return SelectorScoper("c1").scope(selector, SourceLocation{"u"}, diag);
}

DiagnosticEngine& quiet(DiagnosticEngine& diag) {
    diag.setEcho(false);
    return diag;
}

std::optional<Stylesheet> parseStyle(const std::string& css, DiagnosticEngine& diag,
                                     bool global = false) {
    quiet(diag);
    StyleLexer lexer(css, SourceLocation{"u"}, diag);
    auto tokens = lexer.tokenize();
    StyleParserOptions options;
    options.scope_token = "c1";
    options.global = global;
    return StyleParser(std::move(tokens), diag, options).parse();
}

size_t occurrences(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

} // namespace

// ─── Selector scoping ───────────────────────────────────────────────

TEST(SelectorScoperTest, ScopesTheLastCompound) {
    EXPECT_EQ(scoped(".box"), ".box" + kPred);
    EXPECT_EQ(scoped(".list .item"), ".list .item" + kPred);
    EXPECT_EQ(scoped("ul>li"), "ul > li" + kPred);
    EXPECT_EQ(scoped("h1 + p ~ span"), "h1 + p ~ span" + kPred);
    EXPECT_EQ(scoped("*"), "*" + kPred);
}

TEST(SelectorScoperTest, PredicateGoesBeforePseudos) {
    EXPECT_EQ(scoped("a:hover"), "a" + kPred + ":hover");
    EXPECT_EQ(scoped("p::before"), "p" + kPred + "::before");
    EXPECT_EQ(scoped("li:not(.a:first-child)"), "li" + kPred + ":not(.a:first-child)");
    EXPECT_EQ(scoped("input[type=\"a:b\"]:focus"), "input[type=\"a:b\"]" + kPred + ":focus");
}

TEST(SelectorScoperTest, GroupsAreScopedPerSelector) {
    EXPECT_EQ(scoped(".a, .b:hover"), ".a" + kPred + ", .b" + kPred + ":hover");
    EXPECT_EQ(scoped(":is(.x, .y) .z"), ":is(.x, .y) .z" + kPred);
}

TEST(SelectorScoperTest, PredicateAppearsOncePerSelector) {
    for (const char* selector : {".box", ".a .b > .c", "a:hover::after", ".p ::deep .q .r"}) {
        auto out = scoped(selector);
        ASSERT_TRUE(out) << selector;
        EXPECT_EQ(occurrences(*out, kPred), 1u) << *out;
    }
}

TEST(SelectorScoperTest, PierceScopesTheCompoundBeforeTheMarker) {
    EXPECT_EQ(scoped(".card ::deep .title"), ".card" + kPred + " .title");
    EXPECT_EQ(scoped(".card::deep .title span"), ".card" + kPred + " .title span");
    EXPECT_EQ(scoped(".card >>> .title > em"), ".card" + kPred + " .title > em");
    EXPECT_EQ(scoped(".card ::deep > .title"), ".card" + kPred + " > .title");
    EXPECT_EQ(scoped(".outer .card:hover ::deep a"), ".outer .card" + kPred + ":hover a");
}

TEST(SelectorScoperTest, LeadingPierceStandsAlone) {
    EXPECT_EQ(scoped("::deep .child"), kPred + " .child");
    EXPECT_EQ(scoped(">>> .child"), kPred + " .child");
}

TEST(SelectorScoperTest, InvalidSelectors) {
    for (const char* selector : {"", ".a >", "> .a", ".a ,", ".a[x", ".a)", ":not(.a",
                                 "a[title=\"x]", ".a ::deep", ".a ::deep .b ::deep .c",
                                 ".a > ::deep .b", "[prism-scope=\"x\"] .a"}) {
        DiagnosticEngine diag;
        diag.setEcho(false);
        EXPECT_FALSE(SelectorScoper("c1").scope(selector, SourceLocation{"u"}, diag)) << selector;
        EXPECT_TRUE(diag.has(DiagCode::InvalidSelector)) << selector;
    }
}

TEST(SelectorScoperTest, ScopeTokensDiffer) {
    EXPECT_EQ(scopePredicate("p1a2b3c4d"), "[prism-scope=\"p1a2b3c4d\"]");
    EXPECT_NE(SelectorScoper("pa").predicate(), SelectorScoper("pb").predicate());
}

TEST(SplitSelectorGroupTest, IgnoresNestedCommas) {
    auto parts = splitSelectorGroup("a, :is(b, c), d[title=\"x,y\"]");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], ":is(b, c)");
    EXPECT_EQ(parts[2], "d[title=\"x,y\"]");
}

TEST(SelectorScoperTest, EscapedCharactersStayInTheCompound) {
    EXPECT_EQ(scoped(".sm\\:flex"), ".sm\\:flex" + kPred);
    EXPECT_EQ(scoped(".sm\\:flex:hover"), ".sm\\:flex" + kPred + ":hover");
    EXPECT_EQ(scoped(".a\\ b"), ".a\\ b" + kPred);
    EXPECT_EQ(scoped("div .w-1\\/2"), "div .w-1\\/2" + kPred);

    auto parts = splitSelectorGroup(".a\\,b, .c");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], ".a\\,b");
}

// ─── Style parser ───────────────────────────────────────────────────

TEST(StyleParserTest, ScopedRule) {
    DiagnosticEngine diag;
    auto sheet = parseStyle(".box { color: red; }", diag);
    ASSERT_TRUE(sheet);
    ASSERT_EQ(sheet->rules.size(), 1u);
    const auto& rule = sheet->rules[0];
    EXPECT_TRUE(rule.scoped);
    EXPECT_EQ(rule.selector, ".box");
    EXPECT_EQ(rule.emitted_selector, ".box" + kPred);
    ASSERT_EQ(rule.declarations.size(), 1u);
    EXPECT_EQ(rule.declarations[0].property, "color");
    EXPECT_EQ(rule.declarations[0].value, "red");
}

TEST(StyleParserTest, EscapedSelectorSurvivesLexing) {
    DiagnosticEngine diag;
    auto sheet = parseStyle(".sm\\:flex { color: red; }\n.x\\{ { margin: 0; }", diag);
    ASSERT_TRUE(sheet);
    ASSERT_EQ(sheet->rules.size(), 2u);
    EXPECT_EQ(sheet->rules[0].emitted_selector, ".sm\\:flex" + kPred);
    EXPECT_EQ(sheet->rules[1].emitted_selector, ".x\\{" + kPred);
}

TEST(StyleParserTest, GlobalSectionIsEmittedUnchanged) {
    DiagnosticEngine diag;
    auto sheet = parseStyle("body  >  .app:hover { margin: 0 }", diag, true);
    ASSERT_TRUE(sheet);
    EXPECT_FALSE(sheet->rules[0].scoped);
    EXPECT_EQ(sheet->rules[0].emitted_selector, sheet->rules[0].selector);
}

TEST(StyleParserTest, GlobalBlockInsideScopedSection) {
    DiagnosticEngine diag;
    auto sheet = parseStyle("@global { html { font-size: 16px; } }\n.a { b: c; }", diag);
    ASSERT_TRUE(sheet);
    ASSERT_EQ(sheet->rules.size(), 2u);
    EXPECT_EQ(sheet->rules[0].emitted_selector, "html");
    EXPECT_EQ(sheet->rules[1].emitted_selector, ".a" + kPred);
}

TEST(StyleParserTest, MediaRulesAreScopedInside) {
    DiagnosticEngine diag;
    auto sheet = parseStyle("@media (max-width: 600px) { .a { display: none; } }", diag);
    ASSERT_TRUE(sheet);
    const auto& media = sheet->rules[0];
    EXPECT_EQ(media.kind, StyleRuleKind::Conditional);
    EXPECT_EQ(media.selector, "@media (max-width: 600px)");
    ASSERT_EQ(media.children.size(), 1u);
    EXPECT_EQ(media.children[0].emitted_selector, ".a" + kPred);
}

TEST(StyleParserTest, KeyframesAreVerbatim) {
    DiagnosticEngine diag;
    auto sheet = parseStyle("@keyframes fade { from { opacity: 0; } to { opacity: 1; } }", diag);
    ASSERT_TRUE(sheet);
    const auto& frames = sheet->rules[0];
    EXPECT_EQ(frames.kind, StyleRuleKind::Verbatim);
    ASSERT_EQ(frames.children.size(), 2u);
    EXPECT_EQ(frames.children[0].emitted_selector, "from");
}

TEST(StyleParserTest, StatementAtRule) {
    DiagnosticEngine diag;
    auto sheet = parseStyle("@import url(\"base.css\");\n.a { b: c; }", diag);
    ASSERT_TRUE(sheet);
    EXPECT_EQ(sheet->rules[0].kind, StyleRuleKind::Statement);
}

TEST(StyleParserTest, DeclarationWithoutColonIsInvalid) {
    DiagnosticEngine diag;
    EXPECT_FALSE(parseStyle(".a {\n  color red;\n}", diag));
    ASSERT_TRUE(diag.has(DiagCode::InvalidDeclaration));
    EXPECT_EQ(diag.diagnostics()[0].loc.line, 2u);
}

TEST(StyleParserTest, NestedRuleIsInvalid) {
    DiagnosticEngine diag;
    EXPECT_FALSE(parseStyle(".a { .b { c: d; } }", diag));
    EXPECT_TRUE(diag.has(DiagCode::InvalidDeclaration));
}

TEST(StyleParserTest, InvalidSelectorHaltsTheSection) {
    DiagnosticEngine diag;
    EXPECT_FALSE(parseStyle(".a > { x: y; }\n.b { x: y; }", diag));
    EXPECT_EQ(diag.errorCount(), 1);
    EXPECT_TRUE(diag.has(DiagCode::InvalidSelector));
}

TEST(StyleParserTest, UnclosedRule) {
    DiagnosticEngine diag;
    EXPECT_FALSE(parseStyle(".a { x: y;", diag));
    EXPECT_TRUE(diag.has(DiagCode::InvalidSelector));
}

// ─── Emitter ────────────────────────────────────────────────────────

TEST(CssEmitterTest, EmitsRulesInOrder) {
    DiagnosticEngine diag;
    auto sheet = parseStyle(".a { color: red; margin: 0 auto }\n"
                            "@media print { .b { display: none; } }", diag);
    ASSERT_TRUE(sheet);
    std::string css = CssEmitter().emit(*sheet);
    EXPECT_EQ(css,
              ".a" + kPred + " {\n"
              "  color: red;\n"
              "  margin: 0 auto;\n"
              "}\n"
              "\n"
              "@media print {\n"
              "  .b" + kPred + " {\n"
              "    display: none;\n"
              "  }\n"
              "}\n");
}

TEST(CssEmitterTest, OutputIsDeterministic) {
    DiagnosticEngine diag;
    auto sheet = parseStyle(".x, .y { a: b; }", diag);
    ASSERT_TRUE(sheet);
    CssEmitter emitter;
    EXPECT_EQ(emitter.emit(*sheet), emitter.emit(*sheet));
}
