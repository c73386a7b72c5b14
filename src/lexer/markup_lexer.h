#pragma once

#include "common/diagnostics.h"
#include "lexer/token.h"

#include <string>
#include <vector>

namespace prism {

class MarkupLexer {
public:
    MarkupLexer(const std::string& source, const SourceLocation& base, DiagnosticEngine& diag);

    // Stops at the first error; the stream still ends with Eof.
    std::vector<MarkupToken> tokenize();

private:
    bool lexTag(std::vector<MarkupToken>& tokens);
    bool lexEndTag(std::vector<MarkupToken>& tokens);
    bool lexInterpolation(std::vector<MarkupToken>& tokens);
    void lexText(std::vector<MarkupToken>& tokens);

    char peek(size_t ahead = 0) const;
    char advance();
    bool startsWith(const char* s) const;
    bool isAtEnd() const;
    void skipWhitespace();
    SourceLocation here() const;

    std::string source_;
    std::string filename_;
    DiagnosticEngine& diag_;

    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t col_ = 1;
    uint32_t baseOffset_ = 0;
};

} // namespace prism
