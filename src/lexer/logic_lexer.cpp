#include "lexer/logic_lexer.h"

#include <cctype>

namespace prism {

LogicLexer::LogicLexer(const std::string& source, const SourceLocation& base,
                       DiagnosticEngine& diag, bool insertSemicolons)
    : source_(source), filename_(base.file), diag_(diag), insertSemicolons_(insertSemicolons),
      line_(base.line), col_(base.col), baseOffset_(base.offset) {}

char LogicLexer::peek() const {
    if (isAtEnd()) return '\0';
    return source_[pos_];
}

char LogicLexer::peekNext() const {
    if (pos_ + 1 >= source_.size()) return '\0';
    return source_[pos_ + 1];
}

char LogicLexer::advance() {
    char c = source_[pos_++];
    if (c == '\n') {
        ++line_;
        col_ = 1;
    } else {
        ++col_;
    }
    return c;
}

bool LogicLexer::isAtEnd() const {
    return pos_ >= source_.size();
}

SourceLocation LogicLexer::here() const {
    return {filename_, line_, col_, baseOffset_ + static_cast<uint32_t>(pos_)};
}

void LogicLexer::skipWhitespace() {
    while (!isAtEnd()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || (!insertSemicolons_ && c == '\n')) {
            advance();
        } else {
            break;
        }
    }
}

void LogicLexer::skipLineComment() {
    while (!isAtEnd() && peek() != '\n') {
        advance();
    }
}

void LogicLexer::skipBlockComment() {
    // Already consumed /*
    while (!isAtEnd()) {
        if (peek() == '*' && peekNext() == '/') {
            advance(); advance();
            return;
        }
        advance();
    }
    diag_.error(DiagCode::InvalidExpression, here(), "unterminated block comment");
}

Token LogicLexer::lexString(char quote) {
    // Opening quote already consumed
    SourceLocation start = here();
    start.col -= 1;
    std::string value;

    while (!isAtEnd() && peek() != quote) {
        if (peek() == '\n') {
            diag_.error(DiagCode::InvalidExpression, here(), "unterminated string literal");
            return Token{TokenKind::StringLit, value, start};
        }
        if (peek() == '\\') {
            advance();
            if (isAtEnd()) break;
            char esc = advance();
            switch (esc) {
                case 'n':  value += '\n'; break;
                case 't':  value += '\t'; break;
                case 'r':  value += '\r'; break;
                case '\\': value += '\\'; break;
                case '"':  value += '"';  break;
                case '\'': value += '\''; break;
                default:
                    diag_.warning(here(), std::string("unknown escape sequence '\\") + esc + "'");
                    value += esc;
                    break;
            }
        } else {
            value += advance();
        }
    }

    if (isAtEnd()) {
        diag_.error(DiagCode::InvalidExpression, start, "unterminated string literal");
    } else {
        advance(); // closing quote
    }

    return Token{TokenKind::StringLit, value, start};
}

Token LogicLexer::lexNumber() {
    SourceLocation start = here();
    size_t begin = pos_;

    while (!isAtEnd() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')) advance();

    bool isFloat = false;
    if (!isAtEnd() && peek() == '.' && std::isdigit(static_cast<unsigned char>(peekNext()))) {
        isFloat = true;
        advance(); // consume .
        while (!isAtEnd() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')) advance();
    }

    // Exponent
    if (!isAtEnd() && (peek() == 'e' || peek() == 'E')) {
        isFloat = true;
        advance();
        if (!isAtEnd() && (peek() == '+' || peek() == '-')) advance();
        while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) advance();
    }

    std::string text;
    for (size_t i = begin; i < pos_; ++i) {
        if (source_[i] != '_') text += source_[i];
    }
    return Token{isFloat ? TokenKind::FloatLit : TokenKind::IntLit, text, start};
}

Token LogicLexer::lexIdentOrKeyword() {
    SourceLocation start = here();
    size_t begin = pos_;

    while (!isAtEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
        advance();
    }

    std::string text = source_.substr(begin, pos_ - begin);

    auto& keywords = keywordMap();
    auto it = keywords.find(text);
    if (it != keywords.end()) {
        return Token{it->second, text, start};
    }

    return Token{TokenKind::Ident, text, start};
}

bool LogicLexer::shouldInsertSemicolon(TokenKind lastKind) const {
    // A declaration ends at the end of its line when the last token can end one.
    switch (lastKind) {
        case TokenKind::Ident:
        case TokenKind::IntLit:
        case TokenKind::FloatLit:
        case TokenKind::StringLit:
        case TokenKind::True:
        case TokenKind::False:
        case TokenKind::Null:
        case TokenKind::RParen:
        case TokenKind::RBrace:
        case TokenKind::RBracket:
            return true;
        default:
            return false;
    }
}

std::vector<Token> LogicLexer::tokenize() {
    std::vector<Token> tokens;
    TokenKind lastKind = TokenKind::Semicolon;

    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) break;

        char c = peek();

        if (c == '\n') {
            SourceLocation at = here();
            advance();
            if (insertSemicolons_ && shouldInsertSemicolon(lastKind)) {
                tokens.push_back(Token{TokenKind::Semicolon, ";", at});
                lastKind = TokenKind::Semicolon;
            }
            continue;
        }

        // Comments
        if (c == '/' && peekNext() == '/') {
            advance(); advance();
            skipLineComment();
            continue;
        }
        if (c == '/' && peekNext() == '*') {
            advance(); advance();
            skipBlockComment();
            continue;
        }

        Token tok = nextToken();
        if (tok.is(TokenKind::Eof)) {
            // Unexpected character, already reported.
            continue;
        }
        lastKind = tok.kind;
        tokens.push_back(std::move(tok));
    }

    if (insertSemicolons_ && shouldInsertSemicolon(lastKind)) {
        tokens.push_back(Token{TokenKind::Semicolon, ";", here()});
    }

    tokens.push_back(Token{TokenKind::Eof, "", here()});
    return tokens;
}

Token LogicLexer::nextToken() {
    SourceLocation start = here();
    char c = peek();

    if (c == '"' || c == '\'') {
        advance();
        return lexString(c);
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        return lexNumber();
    }

    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        return lexIdentOrKeyword();
    }

    advance(); // consume the character
    switch (c) {
        case '(': return Token{TokenKind::LParen,    "(", start};
        case ')': return Token{TokenKind::RParen,    ")", start};
        case '{': return Token{TokenKind::LBrace,    "{", start};
        case '}': return Token{TokenKind::RBrace,    "}", start};
        case '[': return Token{TokenKind::LBracket,  "[", start};
        case ']': return Token{TokenKind::RBracket,  "]", start};
        case ',': return Token{TokenKind::Comma,     ",", start};
        case ';': return Token{TokenKind::Semicolon, ";", start};
        case '.': return Token{TokenKind::Dot,       ".", start};
        case ':': return Token{TokenKind::Colon,     ":", start};
        case '?': return Token{TokenKind::Question,  "?", start};
        case '+': return Token{TokenKind::Plus,      "+", start};
        case '-': return Token{TokenKind::Minus,     "-", start};
        case '*': return Token{TokenKind::Star,      "*", start};
        case '/': return Token{TokenKind::Slash,     "/", start};
        case '%': return Token{TokenKind::Percent,   "%", start};

        case '=':
            if (peek() == '=') {
                advance();
                if (peek() == '=') advance(); // === reads as ==
                return Token{TokenKind::Equal, "==", start};
            }
            return Token{TokenKind::Assign, "=", start};

        case '!':
            if (peek() == '=') {
                advance();
                if (peek() == '=') advance();
                return Token{TokenKind::NotEqual, "!=", start};
            }
            return Token{TokenKind::Bang, "!", start};

        case '<':
            if (peek() == '=') { advance(); return Token{TokenKind::LessEqual, "<=", start}; }
            return Token{TokenKind::Less, "<", start};

        case '>':
            if (peek() == '=') { advance(); return Token{TokenKind::GreaterEqual, ">=", start}; }
            return Token{TokenKind::Greater, ">", start};

        case '&':
            if (peek() == '&') { advance(); return Token{TokenKind::AmpAmp, "&&", start}; }
            break;

        case '|':
            if (peek() == '|') { advance(); return Token{TokenKind::PipePipe, "||", start}; }
            return Token{TokenKind::Pipe, "|", start};

        default:
            break;
    }

    diag_.error(DiagCode::InvalidExpression, start, std::string("unexpected character '") + c + "'");
    return Token{TokenKind::Eof, "", start};
}

} // namespace prism
