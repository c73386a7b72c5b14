#pragma once

#include "common/diagnostics.h"
#include "lexer/token.h"
#include "parser/expr_ast.h"

#include <string>
#include <vector>

namespace prism {

// Precedence-climbing parser shared by the logic section (default values)
// and template expressions.
class ExprParser {
public:
    ExprParser(const std::vector<Token>& tokens, size_t& pos, DiagnosticEngine& diag);

    ExprPtr parseExpr();          // full expression, including filters
    ExprPtr parseTernary();       // expression without a trailing filter chain

    // Parse a standalone expression string. Returns null and reports
    // InvalidExpression if the text is not exactly one expression.
    static ExprPtr parseString(const std::string& text, const SourceLocation& loc,
                               DiagnosticEngine& diag);

private:
    const Token& peek() const;
    const Token& advance();
    bool check(TokenKind kind) const;
    bool match(TokenKind kind);
    bool expect(TokenKind kind, const std::string& msg);

    ExprPtr parseOr();
    ExprPtr parseAnd();
    ExprPtr parseComparison();
    ExprPtr parseAddition();
    ExprPtr parseMultiplication();
    ExprPtr parseUnary();
    ExprPtr parsePostfix();
    ExprPtr parsePrimary();

    const std::vector<Token>& tokens_;
    size_t& pos_;
    DiagnosticEngine& diag_;
    bool failed_ = false;
};

} // namespace prism
