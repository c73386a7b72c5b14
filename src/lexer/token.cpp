#include "lexer/token.h"

namespace prism {

const char* tokenKindName(TokenKind kind) {
    switch (kind) {
        case TokenKind::Ident:        return "identifier";
        case TokenKind::IntLit:       return "integer literal";
        case TokenKind::FloatLit:     return "float literal";
        case TokenKind::StringLit:    return "string literal";
        case TokenKind::Import:       return "import";
        case TokenKind::From:         return "from";
        case TokenKind::Prop:         return "prop";
        case TokenKind::State:        return "state";
        case TokenKind::Method:       return "method";
        case TokenKind::True:         return "true";
        case TokenKind::False:        return "false";
        case TokenKind::Null:         return "null";
        case TokenKind::In:           return "in";
        case TokenKind::Plus:         return "+";
        case TokenKind::Minus:        return "-";
        case TokenKind::Star:         return "*";
        case TokenKind::Slash:        return "/";
        case TokenKind::Percent:      return "%";
        case TokenKind::Bang:         return "!";
        case TokenKind::Assign:       return "=";
        case TokenKind::Equal:        return "==";
        case TokenKind::NotEqual:     return "!=";
        case TokenKind::Less:         return "<";
        case TokenKind::Greater:      return ">";
        case TokenKind::LessEqual:    return "<=";
        case TokenKind::GreaterEqual: return ">=";
        case TokenKind::AmpAmp:       return "&&";
        case TokenKind::PipePipe:     return "||";
        case TokenKind::Pipe:         return "|";
        case TokenKind::Question:     return "?";
        case TokenKind::LParen:       return "(";
        case TokenKind::RParen:       return ")";
        case TokenKind::LBrace:       return "{";
        case TokenKind::RBrace:       return "}";
        case TokenKind::LBracket:     return "[";
        case TokenKind::RBracket:     return "]";
        case TokenKind::Dot:          return ".";
        case TokenKind::Comma:        return ",";
        case TokenKind::Colon:        return ":";
        case TokenKind::Semicolon:    return ";";
        case TokenKind::Eof:          return "EOF";
    }
    return "unknown";
}

const std::unordered_map<std::string, TokenKind>& keywordMap() {
    static const std::unordered_map<std::string, TokenKind> keywords = {
        {"import", TokenKind::Import},
        {"from",   TokenKind::From},
        {"prop",   TokenKind::Prop},
        {"state",  TokenKind::State},
        {"method", TokenKind::Method},
        {"true",   TokenKind::True},
        {"false",  TokenKind::False},
        {"null",   TokenKind::Null},
        {"in",     TokenKind::In},
    };
    return keywords;
}

const char* markupTokenKindName(MarkupTokenKind kind) {
    switch (kind) {
        case MarkupTokenKind::TagOpen:       return "tag";
        case MarkupTokenKind::AttrName:      return "attribute name";
        case MarkupTokenKind::AttrValue:     return "attribute value";
        case MarkupTokenKind::TagEnd:        return "'>'";
        case MarkupTokenKind::SelfClose:     return "'/>'";
        case MarkupTokenKind::EndTag:        return "end tag";
        case MarkupTokenKind::Text:          return "text";
        case MarkupTokenKind::Interpolation: return "interpolation";
        case MarkupTokenKind::Eof:           return "EOF";
    }
    return "unknown";
}

const char* styleTokenKindName(StyleTokenKind kind) {
    switch (kind) {
        case StyleTokenKind::AtKeyword: return "at-rule";
        case StyleTokenKind::Chunk:     return "text";
        case StyleTokenKind::LBrace:    return "'{'";
        case StyleTokenKind::RBrace:    return "'}'";
        case StyleTokenKind::Semicolon: return "';'";
        case StyleTokenKind::Eof:       return "EOF";
    }
    return "unknown";
}

} // namespace prism
