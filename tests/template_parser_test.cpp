#include <gtest/gtest.h>

#include "lexer/markup_lexer.h"
#include "parser/template_parser.h"
#include "parser/template_printer.h"

#include <string>

using namespace prism;

namespace {

std::optional<Template> parseMarkup(const std::string& source, DiagnosticEngine& diag,
                                    bool strict = false) {
    diag.setEcho(false);
    MarkupLexer lexer(source, SourceLocation{"page"}, diag);
    auto tokens = lexer.tokenize();
    if (diag.hasErrors()) return std::nullopt;
    TemplateParserOptions options;
    options.strict_directives = strict;
    return TemplateParser(std::move(tokens), diag, options).parse();
}

template<typename T>
const T& as(const NodePtr& node) {
    return std::get<T>(node->kind);
}

} // namespace

TEST(TemplateParserTest, ElementsTextAndInterpolation) {
    DiagnosticEngine diag;
    auto tmpl = parseMarkup("<div class=\"card\"><h1>Hi {{ name }}!</h1><br></div>", diag);
    ASSERT_TRUE(tmpl);
    ASSERT_EQ(tmpl->roots.size(), 1u);

    const auto& div = as<node::Element>(tmpl->roots[0]);
    EXPECT_EQ(div.tag, "div");
    ASSERT_NE(div.findAttribute("class"), nullptr);
    EXPECT_EQ(div.findAttribute("class")->value, "card");
    ASSERT_EQ(div.children.size(), 2u);

    const auto& h1 = as<node::Element>(div.children[0]);
    ASSERT_EQ(h1.children.size(), 3u);
    EXPECT_EQ(as<node::Text>(h1.children[0]).value, "Hi ");
    EXPECT_EQ(as<node::Interpolation>(h1.children[1]).expr.text, "name");
    EXPECT_EQ(as<node::Text>(h1.children[2]).value, "!");

    EXPECT_EQ(as<node::Element>(div.children[1]).tag, "br");
    EXPECT_EQ(tmpl->expr_count, 1u);
}

TEST(TemplateParserTest, ForestKeepsDocumentOrder) {
    DiagnosticEngine diag;
    auto tmpl = parseMarkup("<header></header>\n<main></main>\n<footer/>", diag);
    ASSERT_TRUE(tmpl);
    ASSERT_EQ(tmpl->roots.size(), 3u);
    EXPECT_EQ(as<node::Element>(tmpl->roots[0]).tag, "header");
    EXPECT_EQ(as<node::Element>(tmpl->roots[2]).tag, "footer");
}

TEST(TemplateParserTest, InterpolationFilters) {
    DiagnosticEngine diag;
    auto tmpl = parseMarkup("<p>{{ a || b | upper | default('n/a') }}</p>", diag);
    ASSERT_TRUE(tmpl);
    const auto& p = as<node::Element>(tmpl->roots[0]);
    const auto& interp = as<node::Interpolation>(p.children[0]);
    EXPECT_EQ(interp.expr.text, "a || b");
    ASSERT_EQ(interp.filters.size(), 2u);
    EXPECT_EQ(interp.filters[0], "upper");
    EXPECT_EQ(interp.filters[1], "default('n/a')");
}

TEST(TemplateParserTest, BindingsAndEvents) {
    DiagnosticEngine diag;
    auto tmpl = parseMarkup("<button :disabled=\"busy\" p-bind:title=\"label\" @click=\"save\" "
                            "p-on:focus=\"track\">Go</button>", diag);
    ASSERT_TRUE(tmpl);
    const auto& button = as<node::Element>(tmpl->roots[0]);
    ASSERT_EQ(button.directives.size(), 4u);
    EXPECT_EQ(button.directives[0].kind, DirectiveKind::Bind);
    EXPECT_EQ(button.directives[0].arg, "disabled");
    EXPECT_EQ(button.directives[1].arg, "title");
    EXPECT_EQ(button.directives[2].kind, DirectiveKind::On);
    EXPECT_EQ(button.directives[2].expr.text, "save");
    EXPECT_EQ(button.directives[3].arg, "focus");
}

TEST(TemplateParserTest, ConditionalChain) {
    DiagnosticEngine diag;
    auto tmpl = parseMarkup("<p p-if=\"a\">A</p><p p-else-if=\"b\">B</p><p p-else>C</p>", diag);
    ASSERT_TRUE(tmpl);
    ASSERT_EQ(tmpl->roots.size(), 1u);

    const auto& first = as<node::Conditional>(tmpl->roots[0]);
    EXPECT_EQ(first.cond.text, "a");
    ASSERT_TRUE(first.else_branch);
    const auto& second = as<node::Conditional>(first.else_branch);
    EXPECT_EQ(second.cond.text, "b");
    ASSERT_TRUE(second.else_branch);
    EXPECT_EQ(as<node::Element>(second.else_branch).tag, "p");
}

TEST(TemplateParserTest, ElseWithoutIfIsAnError) {
    DiagnosticEngine diag;
    EXPECT_FALSE(parseMarkup("<p p-else>x</p>", diag));
    EXPECT_TRUE(diag.has(DiagCode::InvalidMarkup));
}

TEST(TemplateParserTest, TextBreaksAConditionalChain) {
    DiagnosticEngine diag;
    EXPECT_FALSE(parseMarkup("<p p-if=\"a\">A</p> text <p p-else>C</p>", diag));
}

TEST(TemplateParserTest, LoopWithIndexAndKey) {
    DiagnosticEngine diag;
    auto tmpl = parseMarkup("<ul><li p-for=\"(item, i) in items\" :key=\"item.id\">{{ item.name }}</li></ul>", diag);
    ASSERT_TRUE(tmpl);
    const auto& ul = as<node::Element>(tmpl->roots[0]);
    const auto& loop = as<node::Loop>(ul.children[0]);
    EXPECT_EQ(loop.binding, "item");
    ASSERT_TRUE(loop.index);
    EXPECT_EQ(*loop.index, "i");
    EXPECT_EQ(loop.iterable.text, "items");
    ASSERT_TRUE(loop.key);
    EXPECT_EQ(loop.key->text, "item.id");
    EXPECT_TRUE(as<node::Element>(loop.body).directives.empty());
}

TEST(TemplateParserTest, MalformedLoopHeader) {
    DiagnosticEngine diag;
    EXPECT_FALSE(parseMarkup("<li p-for=\"items\"></li>", diag));
    EXPECT_TRUE(diag.has(DiagCode::InvalidMarkup));
}

TEST(TemplateParserTest, LoopBindingMustBeAPlainIdentifier) {
    DiagnosticEngine diag;
    EXPECT_FALSE(parseMarkup("<li p-for=\"$x in items\">{{ $x }}</li>", diag));
    EXPECT_TRUE(diag.has(DiagCode::InvalidMarkup));

    DiagnosticEngine indexDiag;
    EXPECT_FALSE(parseMarkup("<li p-for=\"(x, $i) in items\"></li>", indexDiag));
    EXPECT_TRUE(indexDiag.has(DiagCode::InvalidMarkup));
}

TEST(TemplateParserTest, UnclosedElement) {
    DiagnosticEngine diag;
    EXPECT_FALSE(parseMarkup("<div><span></div>", diag));
    EXPECT_TRUE(diag.has(DiagCode::UnclosedElement));

    DiagnosticEngine eof;
    EXPECT_FALSE(parseMarkup("<div>", eof));
    EXPECT_TRUE(eof.has(DiagCode::UnclosedElement));
}

TEST(TemplateParserTest, StrayClosingTag) {
    DiagnosticEngine diag;
    EXPECT_FALSE(parseMarkup("</div>", diag));
    EXPECT_TRUE(diag.has(DiagCode::InvalidMarkup));
}

TEST(TemplateParserTest, UnknownDirectiveWarnsByDefault) {
    DiagnosticEngine diag;
    auto tmpl = parseMarkup("<div p-show=\"x\"></div>", diag);
    ASSERT_TRUE(tmpl);
    EXPECT_FALSE(diag.hasErrors());
    EXPECT_EQ(diag.warningCount(), 1);
    EXPECT_TRUE(diag.has(DiagCode::UnknownDirective));
}

TEST(TemplateParserTest, UnknownDirectiveFailsWhenStrict) {
    DiagnosticEngine diag;
    EXPECT_FALSE(parseMarkup("<div p-show=\"x\"></div>", diag, true));
    EXPECT_TRUE(diag.hasErrors());
    EXPECT_TRUE(diag.has(DiagCode::UnknownDirective));
}

TEST(TemplateParserTest, SlotWithFallback) {
    DiagnosticEngine diag;
    auto tmpl = parseMarkup("<section><slot name=\"header\"><h2>Default</h2></slot><slot/></section>", diag);
    ASSERT_TRUE(tmpl);
    const auto& section = as<node::Element>(tmpl->roots[0]);
    const auto& named = as<node::Slot>(section.children[0]);
    EXPECT_EQ(named.name, "header");
    EXPECT_EQ(named.fallback.size(), 1u);
    EXPECT_EQ(as<node::Slot>(section.children[1]).name, "");
}

TEST(TemplateParserTest, SlotTargetLooksThroughDirectives) {
    DiagnosticEngine diag;
    auto tmpl = parseMarkup("<Card><p slot=\"footer\" p-if=\"x\">F</p><p>body</p></Card>", diag);
    ASSERT_TRUE(tmpl);
    const auto& card = as<node::Element>(tmpl->roots[0]);
    EXPECT_TRUE(isComponentTag(card.tag));
    EXPECT_EQ(slotTargetOf(*card.children[0]), "footer");
    EXPECT_EQ(slotTargetOf(*card.children[1]), "");
}

TEST(TemplatePrinterTest, PrintedTemplateReparsesToTheSameTree) {
    const std::string source =
        "<div class=\"card\" :title=\"heading\" @click=\"open\">"
        "<h1>{{ title | upper }}</h1>"
        "<p p-if=\"count > 1\">many</p><p p-else-if=\"count == 1\">one</p><p p-else>none</p>"
        "<ul><li p-for=\"(tag, i) in tags\" :key=\"tag\">{{ i }}: {{ tag }}</li></ul>"
        "<slot name=\"footer\"><small>fallback</small></slot>"
        "<input disabled>"
        "</div>";

    DiagnosticEngine diag;
    auto first = parseMarkup(source, diag);
    ASSERT_TRUE(first);

    TemplatePrinter printer;
    std::string printed = printer.print(first->roots);

    DiagnosticEngine again;
    auto second = parseMarkup(printed, again);
    ASSERT_TRUE(second) << printed;
    EXPECT_TRUE(structurallyEqual(first->roots, second->roots)) << printed;
}
