#pragma once

#include "common/diagnostics.h"
#include "lexer/token.h"

#include <string>
#include <vector>

namespace prism {

// Tokenizer for the logic section and for template expressions.
// `base` is the location of the first character of `source` inside the unit.
class LogicLexer {
public:
    LogicLexer(const std::string& source, const SourceLocation& base, DiagnosticEngine& diag,
               bool insertSemicolons = true);

    std::vector<Token> tokenize();

private:
    Token nextToken();

    char peek() const;
    char peekNext() const;
    char advance();
    bool isAtEnd() const;
    SourceLocation here() const;

    void skipWhitespace();
    void skipLineComment();
    void skipBlockComment();

    Token lexString(char quote);
    Token lexNumber();
    Token lexIdentOrKeyword();

    bool shouldInsertSemicolon(TokenKind lastKind) const;

    std::string source_;
    std::string filename_;
    DiagnosticEngine& diag_;
    bool insertSemicolons_;

    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t col_ = 1;
    uint32_t baseOffset_ = 0;
};

} // namespace prism
