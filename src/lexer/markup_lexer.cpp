#include "lexer/markup_lexer.h"

#include <cctype>
#include <cstring>

namespace prism {

MarkupLexer::MarkupLexer(const std::string& source, const SourceLocation& base,
                         DiagnosticEngine& diag)
    : source_(source), filename_(base.file), diag_(diag),
      line_(base.line), col_(base.col), baseOffset_(base.offset) {}

char MarkupLexer::peek(size_t ahead) const {
    if (pos_ + ahead >= source_.size()) return '\0';
    return source_[pos_ + ahead];
}

char MarkupLexer::advance() {
    char c = source_[pos_++];
    if (c == '\n') {
        ++line_;
        col_ = 1;
    } else {
        ++col_;
    }
    return c;
}

bool MarkupLexer::startsWith(const char* s) const {
    return source_.compare(pos_, std::strlen(s), s) == 0;
}

bool MarkupLexer::isAtEnd() const {
    return pos_ >= source_.size();
}

void MarkupLexer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) advance();
}

SourceLocation MarkupLexer::here() const {
    return {filename_, line_, col_, baseOffset_ + static_cast<uint32_t>(pos_)};
}

static bool isNameStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool isTagNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == ':';
}

std::vector<MarkupToken> MarkupLexer::tokenize() {
    std::vector<MarkupToken> tokens;

    while (!isAtEnd()) {
        if (startsWith("<!--")) {
            SourceLocation start = here();
            auto end = source_.find("-->", pos_ + 4);
            if (end == std::string::npos) {
                diag_.error(DiagCode::InvalidMarkup, start, "unterminated comment");
                break;
            }
            while (pos_ < end + 3) advance();
            continue;
        }
        if (startsWith("</")) {
            if (!lexEndTag(tokens)) break;
            continue;
        }
        if (peek() == '<' && isNameStart(peek(1))) {
            if (!lexTag(tokens)) break;
            continue;
        }
        if (startsWith("{{")) {
            if (!lexInterpolation(tokens)) break;
            continue;
        }
        lexText(tokens);
    }

    tokens.push_back(MarkupToken{MarkupTokenKind::Eof, "", here()});
    return tokens;
}

void MarkupLexer::lexText(std::vector<MarkupToken>& tokens) {
    SourceLocation start = here();
    std::string text;
    // Always consume at least one character so a lone '<' becomes text.
    text += advance();
    while (!isAtEnd()) {
        if (peek() == '<' && (isNameStart(peek(1)) || peek(1) == '/' || peek(1) == '!')) break;
        if (startsWith("{{")) break;
        text += advance();
    }
    if (!tokens.empty() && tokens.back().is(MarkupTokenKind::Text)) {
        tokens.back().text += text;
        return;
    }
    tokens.push_back(MarkupToken{MarkupTokenKind::Text, text, start});
}

bool MarkupLexer::lexInterpolation(std::vector<MarkupToken>& tokens) {
    SourceLocation start = here();
    advance(); advance(); // {{
    SourceLocation inner = here();
    auto end = source_.find("}}", pos_);
    if (end == std::string::npos) {
        diag_.error(DiagCode::InvalidMarkup, start, "unterminated interpolation '{{'");
        return false;
    }
    std::string body = source_.substr(pos_, end - pos_);
    while (pos_ < end + 2) advance();
    tokens.push_back(MarkupToken{MarkupTokenKind::Interpolation, body, inner});
    return true;
}

bool MarkupLexer::lexEndTag(std::vector<MarkupToken>& tokens) {
    SourceLocation start = here();
    advance(); advance(); // </
    std::string name;
    while (!isAtEnd() && isTagNameChar(peek())) name += advance();
    skipWhitespace();
    if (isAtEnd() || peek() != '>') {
        diag_.error(DiagCode::InvalidMarkup, start,
                    "unterminated end tag '</" + name + "'");
        return false;
    }
    advance(); // >
    if (name.empty()) {
        diag_.error(DiagCode::InvalidMarkup, start, "end tag without a name");
        return false;
    }
    tokens.push_back(MarkupToken{MarkupTokenKind::EndTag, name, start});
    return true;
}

bool MarkupLexer::lexTag(std::vector<MarkupToken>& tokens) {
    SourceLocation start = here();
    advance(); // <
    std::string name;
    while (!isAtEnd() && isTagNameChar(peek())) name += advance();
    tokens.push_back(MarkupToken{MarkupTokenKind::TagOpen, name, start});

    while (true) {
        skipWhitespace();
        if (isAtEnd()) {
            diag_.error(DiagCode::InvalidMarkup, start, "unterminated tag '<" + name + "'");
            return false;
        }
        if (peek() == '>') {
            tokens.push_back(MarkupToken{MarkupTokenKind::TagEnd, ">", here()});
            advance();
            return true;
        }
        if (startsWith("/>")) {
            tokens.push_back(MarkupToken{MarkupTokenKind::SelfClose, "/>", here()});
            advance(); advance();
            return true;
        }

        // Attribute name: everything up to whitespace, '=', '>' or "/>".
        SourceLocation attrLoc = here();
        std::string attr;
        while (!isAtEnd() && !std::isspace(static_cast<unsigned char>(peek())) &&
               peek() != '=' && peek() != '>' && !startsWith("/>")) {
            attr += advance();
        }
        if (attr.empty()) {
            diag_.error(DiagCode::InvalidMarkup, attrLoc,
                        std::string("unexpected '") + peek() + "' in tag '<" + name + "'");
            return false;
        }
        tokens.push_back(MarkupToken{MarkupTokenKind::AttrName, attr, attrLoc});

        skipWhitespace();
        if (isAtEnd() || peek() != '=') continue;
        advance(); // =
        skipWhitespace();

        if (peek() == '"' || peek() == '\'') {
            char quote = advance();
            SourceLocation valueLoc = here();
            std::string value;
            while (!isAtEnd() && peek() != quote) value += advance();
            if (isAtEnd()) {
                diag_.error(DiagCode::InvalidMarkup, valueLoc,
                            "unterminated value for attribute '" + attr + "'");
                return false;
            }
            advance(); // closing quote
            tokens.push_back(MarkupToken{MarkupTokenKind::AttrValue, value, valueLoc});
        } else {
            SourceLocation valueLoc = here();
            std::string value;
            while (!isAtEnd() && !std::isspace(static_cast<unsigned char>(peek())) &&
                   peek() != '>' && !startsWith("/>")) {
                value += advance();
            }
            tokens.push_back(MarkupToken{MarkupTokenKind::AttrValue, value, valueLoc});
        }
    }
}

} // namespace prism
