#include "style/style_parser.h"

#include <algorithm>
#include <cctype>

namespace prism {

StyleParser::StyleParser(std::vector<StyleToken> tokens, DiagnosticEngine& diag,
                         StyleParserOptions options)
    : tokens_(std::move(tokens)), diag_(diag), options_(std::move(options)),
      scoper_(options_.scope_token) {}

static std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool isPropertyName(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') return false;
    }
    return true;
}

// ─── Token stream ───────────────────────────────────────────────────

const StyleToken& StyleParser::peek() const {
    return tokens_[pos_];
}

const StyleToken& StyleParser::advance() {
    const StyleToken& tok = tokens_[pos_];
    if (pos_ < tokens_.size() - 1) ++pos_;
    return tok;
}

bool StyleParser::check(StyleTokenKind kind) const {
    return peek().kind == kind;
}

bool StyleParser::match(StyleTokenKind kind) {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

void StyleParser::fail(DiagCode code, const SourceLocation& loc, const std::string& msg) {
    diag_.error(code, loc, msg);
    throw Abort{};
}

// ─── Rules ──────────────────────────────────────────────────────────

std::optional<Stylesheet> StyleParser::parse() {
    try {
        Stylesheet sheet;
        sheet.rules = parseRules(!options_.global, false);
        return sheet;
    } catch (const Abort&) {
        return std::nullopt;
    }
}

std::vector<StyleRule> StyleParser::parseRules(bool scoped, bool nested) {
    std::vector<StyleRule> rules;

    while (!check(StyleTokenKind::Eof)) {
        if (check(StyleTokenKind::RBrace)) {
            if (nested) return rules;
            fail(DiagCode::InvalidSelector, peek().loc, "unexpected '}'");
        }
        if (match(StyleTokenKind::Semicolon)) continue;

        if (check(StyleTokenKind::AtKeyword)) {
            parseAtRule(scoped, rules);
            continue;
        }
        if (check(StyleTokenKind::LBrace)) {
            fail(DiagCode::InvalidSelector, peek().loc, "empty selector");
        }

        const StyleToken& chunk = advance();
        if (!check(StyleTokenKind::LBrace)) {
            if (chunk.text.find(':') != std::string::npos &&
                (check(StyleTokenKind::Semicolon) || check(StyleTokenKind::RBrace))) {
                fail(DiagCode::InvalidDeclaration, chunk.loc,
                     "declaration '" + chunk.text + "' on line " + std::to_string(chunk.loc.line) +
                     " is outside of any rule");
            }
            fail(DiagCode::InvalidSelector, chunk.loc,
                 "expected '{' after selector '" + chunk.text + "'");
        }
        rules.push_back(parseStyleRule(chunk, scoped));
    }

    if (nested) {
        fail(DiagCode::InvalidSelector, peek().loc, "block is never closed");
    }
    return rules;
}

void StyleParser::parseAtRule(bool scoped, std::vector<StyleRule>& out) {
    const StyleToken& keyword = advance();
    std::string name = lower(keyword.text);

    std::string prelude;
    if (check(StyleTokenKind::Chunk)) prelude = advance().text;

    StyleRule rule;
    rule.loc = keyword.loc;
    rule.selector = prelude.empty() ? keyword.text : keyword.text + " " + prelude;
    rule.emitted_selector = rule.selector;

    if (match(StyleTokenKind::Semicolon)) {
        rule.kind = StyleRuleKind::Statement;
        out.push_back(std::move(rule));
        return;
    }
    if (!match(StyleTokenKind::LBrace)) {
        fail(DiagCode::InvalidSelector, keyword.loc, "expected '{' or ';' after " + keyword.text);
    }

    if (name == "@global") {
        if (!prelude.empty()) {
            fail(DiagCode::InvalidSelector, keyword.loc, "@global takes no prelude");
        }
        auto children = parseRules(false, true);
        advance();  // '}'
        for (auto& child : children) out.push_back(std::move(child));
        return;
    }

    if (name == "@media" || name == "@supports") {
        rule.kind = StyleRuleKind::Conditional;
        rule.scoped = scoped;
        rule.children = parseRules(scoped, true);
        advance();  // '}'
        out.push_back(std::move(rule));
        return;
    }

    // @keyframes, @font-face, @page, ...
    rule.kind = StyleRuleKind::Verbatim;
    parseBody(rule, true);
    out.push_back(std::move(rule));
}

StyleRule StyleParser::parseStyleRule(const StyleToken& selector, bool scoped) {
    StyleRule rule;
    rule.kind = StyleRuleKind::Style;
    rule.selector = selector.text;
    rule.scoped = scoped;
    rule.loc = selector.loc;

    if (scoped) {
        auto rewritten = scoper_.scope(selector.text, selector.loc, diag_);
        if (!rewritten) throw Abort{};
        rule.emitted_selector = *rewritten;
    } else {
        if (!scoper_.validate(selector.text, selector.loc, diag_)) throw Abort{};
        rule.emitted_selector = selector.text;
    }

    advance();  // '{'
    parseBody(rule, false);
    return rule;
}

// Parses declarations up to and including the closing '}'. Verbatim
// at-rules may also nest plain rules (keyframe selectors).
void StyleParser::parseBody(StyleRule& rule, bool allowNested) {
    while (!check(StyleTokenKind::RBrace)) {
        if (check(StyleTokenKind::Eof)) {
            fail(DiagCode::InvalidSelector, rule.loc, "rule '" + rule.selector + "' is never closed");
        }
        if (match(StyleTokenKind::Semicolon)) continue;

        if (check(StyleTokenKind::AtKeyword) || check(StyleTokenKind::LBrace)) {
            fail(DiagCode::InvalidDeclaration, peek().loc,
                 "unexpected '" + peek().text + "' on line " + std::to_string(peek().loc.line) +
                 " inside rule '" + rule.selector + "'");
        }

        const StyleToken& chunk = advance();
        if (check(StyleTokenKind::LBrace)) {
            if (!allowNested) {
                fail(DiagCode::InvalidDeclaration, chunk.loc,
                     "nested rule '" + chunk.text + "' on line " + std::to_string(chunk.loc.line) +
                     " is not supported");
            }
            StyleRule child;
            child.kind = StyleRuleKind::Style;
            child.selector = chunk.text;
            child.emitted_selector = chunk.text;
            child.loc = chunk.loc;
            advance();  // '{'
            parseBody(child, false);
            rule.children.push_back(std::move(child));
            continue;
        }

        rule.declarations.push_back(parseDeclaration(chunk));
        if (!check(StyleTokenKind::RBrace)) {
            match(StyleTokenKind::Semicolon);
        }
    }
    advance();  // '}'
}

StyleDeclaration StyleParser::parseDeclaration(const StyleToken& chunk) {
    auto colon = chunk.text.find(':');
    std::string property = colon == std::string::npos ? "" : trim(chunk.text.substr(0, colon));
    std::string value = colon == std::string::npos ? "" : trim(chunk.text.substr(colon + 1));

    if (!isPropertyName(property) || value.empty()) {
        fail(DiagCode::InvalidDeclaration, chunk.loc,
             "invalid declaration '" + chunk.text + "' on line " + std::to_string(chunk.loc.line) +
             ": expected 'property: value'");
    }
    return StyleDeclaration{property, value, chunk.loc};
}

} // namespace prism
