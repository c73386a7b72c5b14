#pragma once

#include "common/source_location.h"

#include <string>
#include <unordered_map>

namespace prism {

// ─── Logic / expression tokens ──────────────────────────────────────

enum class TokenKind {
    // Literals
    Ident,
    IntLit,
    FloatLit,
    StringLit,

    // Keywords
    Import,
    From,
    Prop,
    State,
    Method,
    True,
    False,
    Null,
    In,

    // Operators
    Plus,           // +
    Minus,          // -
    Star,           // *
    Slash,          // /
    Percent,        // %
    Bang,           // !
    Assign,         // =
    Equal,          // ==
    NotEqual,       // !=
    Less,           // <
    Greater,        // >
    LessEqual,      // <=
    GreaterEqual,   // >=
    AmpAmp,         // &&
    PipePipe,       // ||
    Pipe,           // |
    Question,       // ?

    // Delimiters
    LParen,         // (
    RParen,         // )
    LBrace,         // {
    RBrace,         // }
    LBracket,       // [
    RBracket,       // ]
    Dot,            // .
    Comma,          // ,
    Colon,          // :
    Semicolon,      // ;

    // Special
    Eof,
};

struct Token {
    TokenKind kind;
    std::string text;
    SourceLocation loc;

    bool is(TokenKind k) const { return kind == k; }
    bool isNot(TokenKind k) const { return kind != k; }
};

const char* tokenKindName(TokenKind kind);
const std::unordered_map<std::string, TokenKind>& keywordMap();

// ─── Markup tokens ──────────────────────────────────────────────────

enum class MarkupTokenKind {
    TagOpen,        // <name
    AttrName,       // name, :name, @name, p-if
    AttrValue,      // ="value"
    TagEnd,         // >
    SelfClose,      // />
    EndTag,         // </name>
    Text,
    Interpolation,  // {{ expr }}, text holds the raw inner source
    Eof,
};

struct MarkupToken {
    MarkupTokenKind kind;
    std::string text;
    SourceLocation loc;

    bool is(MarkupTokenKind k) const { return kind == k; }
};

const char* markupTokenKindName(MarkupTokenKind kind);

// ─── Style tokens ───────────────────────────────────────────────────

enum class StyleTokenKind {
    AtKeyword,      // @media, @global, ...
    Chunk,          // selector or declaration text, trimmed
    LBrace,
    RBrace,
    Semicolon,
    Eof,
};

struct StyleToken {
    StyleTokenKind kind;
    std::string text;
    SourceLocation loc;

    bool is(StyleTokenKind k) const { return kind == k; }
};

const char* styleTokenKindName(StyleTokenKind kind);

} // namespace prism
