#pragma once

#include "common/diagnostics.h"
#include "lexer/token.h"
#include "parser/template_ast.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace prism {

struct TemplateParserOptions {
    // Unknown p-* directives are errors instead of warnings.
    bool strict_directives = false;
};

class TemplateParser {
public:
    TemplateParser(std::vector<MarkupToken> tokens, DiagnosticEngine& diag,
                   TemplateParserOptions options = {});

    // Returns nullopt after the first error; the markup section is then
    // considered failed while other sections carry on.
    std::optional<Template> parse();

private:
    struct Abort {};

    struct RawAttr {
        std::string name;
        std::string value;
        bool has_value = false;
        SourceLocation loc;
        SourceLocation value_loc;
    };

    const MarkupToken& peek() const;
    const MarkupToken& advance();
    bool check(MarkupTokenKind kind) const;

    [[noreturn]] void fail(DiagCode code, const SourceLocation& loc, const std::string& msg);

    std::vector<NodePtr> parseChildren(const std::string* parentTag, const SourceLocation* parentLoc);
    NodePtr parseElement(std::string* elseKind, TemplateExpr* elseCond);
    void parseText(std::vector<NodePtr>& out);
    NodePtr parseInterpolation();

    TemplateExpr makeExpr(const std::string& text, const SourceLocation& loc);
    void parseLoopHeader(const RawAttr& attr, node::Loop& loop);
    bool isOpen(const std::string& tag) const;

    std::vector<MarkupToken> tokens_;
    DiagnosticEngine& diag_;
    TemplateParserOptions options_;
    size_t pos_ = 0;
    uint32_t nextExprId_ = 0;
    std::vector<std::pair<std::string, SourceLocation>> open_;
};

// Splits "expr | f1 | f2(x)" on top-level single pipes, honouring quotes,
// brackets and "||".
std::vector<std::string> splitFilters(const std::string& text);

} // namespace prism
