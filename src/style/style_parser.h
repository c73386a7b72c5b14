#pragma once

#include "common/diagnostics.h"
#include "lexer/token.h"
#include "style/selector_scoper.h"
#include "style/style_ast.h"

#include <optional>
#include <string>
#include <vector>

namespace prism {

struct StyleParserOptions {
    std::string scope_token;
    bool global = false;    // <style global>: nothing in the section is scoped
};

// Builds the rule list of a style section and scopes its selectors in the
// same pass. The first error halts the style section.
class StyleParser {
public:
    StyleParser(std::vector<StyleToken> tokens, DiagnosticEngine& diag, StyleParserOptions options);

    std::optional<Stylesheet> parse();

private:
    struct Abort {};

    const StyleToken& peek() const;
    const StyleToken& advance();
    bool check(StyleTokenKind kind) const;
    bool match(StyleTokenKind kind);

    [[noreturn]] void fail(DiagCode code, const SourceLocation& loc, const std::string& msg);

    std::vector<StyleRule> parseRules(bool scoped, bool nested);
    void parseAtRule(bool scoped, std::vector<StyleRule>& out);
    StyleRule parseStyleRule(const StyleToken& selector, bool scoped);
    void parseBody(StyleRule& rule, bool allowNested);
    StyleDeclaration parseDeclaration(const StyleToken& chunk);

    std::vector<StyleToken> tokens_;
    DiagnosticEngine& diag_;
    StyleParserOptions options_;
    SelectorScoper scoper_;
    size_t pos_ = 0;
};

} // namespace prism
