#pragma once

#include "common/diagnostics.h"
#include "lexer/token.h"

#include <string>
#include <vector>

namespace prism {

class StyleLexer {
public:
    StyleLexer(const std::string& source, const SourceLocation& base, DiagnosticEngine& diag);

    std::vector<StyleToken> tokenize();

private:
    void lexChunk(std::vector<StyleToken>& tokens);
    bool skipComment();

    char peek(size_t ahead = 0) const;
    char advance();
    bool isAtEnd() const;
    SourceLocation here() const;

    std::string source_;
    std::string filename_;
    DiagnosticEngine& diag_;
    bool failed_ = false;

    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t col_ = 1;
    uint32_t baseOffset_ = 0;
};

} // namespace prism
