#include "lexer/style_lexer.h"

#include <cctype>

namespace prism {

StyleLexer::StyleLexer(const std::string& source, const SourceLocation& base,
                       DiagnosticEngine& diag)
    : source_(source), filename_(base.file), diag_(diag),
      line_(base.line), col_(base.col), baseOffset_(base.offset) {}

char StyleLexer::peek(size_t ahead) const {
    if (pos_ + ahead >= source_.size()) return '\0';
    return source_[pos_ + ahead];
}

char StyleLexer::advance() {
    char c = source_[pos_++];
    if (c == '\n') {
        ++line_;
        col_ = 1;
    } else {
        ++col_;
    }
    return c;
}

bool StyleLexer::isAtEnd() const {
    return pos_ >= source_.size();
}

SourceLocation StyleLexer::here() const {
    return {filename_, line_, col_, baseOffset_ + static_cast<uint32_t>(pos_)};
}

// Consumes a /* comment */ at the cursor. Returns false if it never ends.
bool StyleLexer::skipComment() {
    SourceLocation start = here();
    advance(); advance();
    while (!isAtEnd()) {
        if (peek() == '*' && peek(1) == '/') {
            advance(); advance();
            return true;
        }
        advance();
    }
    diag_.error(DiagCode::InvalidSelector, start, "unterminated comment");
    failed_ = true;
    return false;
}

std::vector<StyleToken> StyleLexer::tokenize() {
    std::vector<StyleToken> tokens;

    while (!isAtEnd() && !failed_) {
        char c = peek();
        if (std::isspace(static_cast<unsigned char>(c))) {
            advance();
            continue;
        }
        if (c == '/' && peek(1) == '*') {
            skipComment();
            continue;
        }

        SourceLocation start = here();
        switch (c) {
            case '{':
                advance();
                tokens.push_back(StyleToken{StyleTokenKind::LBrace, "{", start});
                continue;
            case '}':
                advance();
                tokens.push_back(StyleToken{StyleTokenKind::RBrace, "}", start});
                continue;
            case ';':
                advance();
                tokens.push_back(StyleToken{StyleTokenKind::Semicolon, ";", start});
                continue;
            default:
                break;
        }

        if (c == '@' && std::isalpha(static_cast<unsigned char>(peek(1)))) {
            std::string name;
            name += advance();
            while (!isAtEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '-')) {
                name += advance();
            }
            tokens.push_back(StyleToken{StyleTokenKind::AtKeyword, name, start});
            continue;
        }

        lexChunk(tokens);
    }

    tokens.push_back(StyleToken{StyleTokenKind::Eof, "", here()});
    return tokens;
}

// A chunk runs until a structural character outside strings, parens and
// brackets. Comments are dropped, everything else is kept verbatim.
void StyleLexer::lexChunk(std::vector<StyleToken>& tokens) {
    SourceLocation start = here();
    std::string text;
    int depth = 0;
    char quote = 0;

    while (!isAtEnd()) {
        char c = peek();
        if (quote) {
            if (c == '\\' && pos_ + 1 < source_.size()) {
                text += advance();
            } else if (c == quote) {
                quote = 0;
            } else if (c == '\n') {
                diag_.error(DiagCode::InvalidSelector, start, "unterminated string in style section");
                failed_ = true;
                return;
            }
            text += advance();
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            text += advance();
            continue;
        }
        if (c == '\\' && pos_ + 1 < source_.size()) {
            text += advance();
            text += advance();
            continue;
        }
        if (c == '/' && peek(1) == '*') {
            if (!skipComment()) return;
            continue;
        }
        if (c == '(' || c == '[') ++depth;
        if ((c == ')' || c == ']') && depth > 0) --depth;
        if (depth == 0 && (c == '{' || c == '}' || c == ';')) break;
        text += advance();
    }

    if (quote) {
        diag_.error(DiagCode::InvalidSelector, start, "unterminated string in style section");
        failed_ = true;
        return;
    }

    auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return;
    text.erase(end + 1);
    tokens.push_back(StyleToken{StyleTokenKind::Chunk, text, start});
}

} // namespace prism
