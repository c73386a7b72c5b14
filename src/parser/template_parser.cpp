#include "parser/template_parser.h"

#include <cctype>

namespace prism {

TemplateParser::TemplateParser(std::vector<MarkupToken> tokens, DiagnosticEngine& diag,
                               TemplateParserOptions options)
    : tokens_(std::move(tokens)), diag_(diag), options_(options) {}

// ─── Helpers ────────────────────────────────────────────────────────

static bool isBlank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static bool isIdentifier(const std::string& s) {
    if (s.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0] != '_') return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

static std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// Location of `text[count]` given the location of `text[0]`.
static SourceLocation advanceLoc(SourceLocation loc, const std::string& text, size_t count) {
    for (size_t i = 0; i < count && i < text.size(); ++i) {
        if (text[i] == '\n') {
            ++loc.line;
            loc.col = 1;
        } else {
            ++loc.col;
        }
        ++loc.offset;
    }
    return loc;
}

static bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::vector<std::string> splitFilters(const std::string& text) {
    std::vector<std::string> parts;
    std::string current;
    char quote = 0;
    int depth = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            current += c;
            if (c == '\\' && i + 1 < text.size()) {
                current += text[++i];
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if ((c == ')' || c == ']' || c == '}') && depth > 0) {
            --depth;
        } else if (c == '|') {
            if (i + 1 < text.size() && text[i + 1] == '|') {
                current += "||";
                ++i;
                continue;
            }
            if (depth == 0) {
                parts.push_back(current);
                current.clear();
                continue;
            }
        }
        current += c;
    }
    parts.push_back(current);
    return parts;
}

// ─── Token stream ───────────────────────────────────────────────────

const MarkupToken& TemplateParser::peek() const {
    return tokens_[pos_];
}

const MarkupToken& TemplateParser::advance() {
    const MarkupToken& tok = tokens_[pos_];
    if (pos_ < tokens_.size() - 1) ++pos_;
    return tok;
}

bool TemplateParser::check(MarkupTokenKind kind) const {
    return peek().kind == kind;
}

void TemplateParser::fail(DiagCode code, const SourceLocation& loc, const std::string& msg) {
    diag_.error(code, loc, msg);
    throw Abort{};
}

bool TemplateParser::isOpen(const std::string& tag) const {
    for (const auto& entry : open_) {
        if (entry.first == tag) return true;
    }
    return false;
}

TemplateExpr TemplateParser::makeExpr(const std::string& text, const SourceLocation& loc) {
    auto lead = text.find_first_not_of(" \t\r\n");
    TemplateExpr e;
    e.text = trim(text);
    e.loc = lead == std::string::npos ? loc : advanceLoc(loc, text, lead);
    e.id = nextExprId_++;
    return e;
}

// ─── Parsing ────────────────────────────────────────────────────────

std::optional<Template> TemplateParser::parse() {
    try {
        Template tmpl;
        tmpl.roots = parseChildren(nullptr, nullptr);
        tmpl.expr_count = nextExprId_;
        return tmpl;
    } catch (const Abort&) {
        return std::nullopt;
    }
}

std::vector<NodePtr> TemplateParser::parseChildren(const std::string* parentTag,
                                                   const SourceLocation* parentLoc) {
    std::vector<NodePtr> children;
    // Innermost conditional of the current if/else-if chain still open for an else.
    node::Conditional* pending = nullptr;

    while (true) {
        const MarkupToken& tok = peek();
        switch (tok.kind) {
            case MarkupTokenKind::Eof:
                if (parentTag) {
                    fail(DiagCode::UnclosedElement, *parentLoc,
                         "element <" + *parentTag + "> is never closed");
                }
                return children;

            case MarkupTokenKind::EndTag:
                if (parentTag && tok.text == *parentTag) {
                    return children;
                }
                if (parentTag && isOpen(tok.text)) {
                    fail(DiagCode::UnclosedElement, *parentLoc,
                         "element <" + *parentTag + "> is not closed before </" + tok.text + ">");
                }
                fail(DiagCode::InvalidMarkup, tok.loc, "unexpected closing tag </" + tok.text + ">");

            case MarkupTokenKind::Text: {
                size_t before = children.size();
                parseText(children);
                if (children.size() != before) pending = nullptr;
                break;
            }

            case MarkupTokenKind::Interpolation:
                children.push_back(parseInterpolation());
                pending = nullptr;
                break;

            case MarkupTokenKind::TagOpen: {
                std::string elseKind;
                TemplateExpr elseCond;
                auto node = parseElement(&elseKind, &elseCond);

                if (!elseKind.empty()) {
                    if (!pending) {
                        fail(DiagCode::InvalidMarkup, node->loc,
                             "'" + elseKind + "' without a preceding 'p-if'");
                    }
                    if (elseKind == "p-else-if") {
                        auto loc = node->loc;
                        auto cond = makeNode<node::Conditional>(loc, elseCond, std::move(node), nullptr);
                        auto* raw = &std::get<node::Conditional>(cond->kind);
                        pending->else_branch = std::move(cond);
                        pending = raw;
                    } else {
                        pending->else_branch = std::move(node);
                        pending = nullptr;
                    }
                    break;
                }

                pending = std::get_if<node::Conditional>(&node->kind);
                children.push_back(std::move(node));
                break;
            }

            default:
                fail(DiagCode::InvalidMarkup, tok.loc,
                     std::string("unexpected ") + markupTokenKindName(tok.kind));
        }
    }
}

void TemplateParser::parseText(std::vector<NodePtr>& out) {
    const MarkupToken& tok = advance();
    if (isBlank(tok.text)) return;

    // Condense whitespace runs to one space.
    std::string value;
    bool inSpace = false;
    for (char c : tok.text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!inSpace) value += ' ';
            inSpace = true;
        } else {
            value += c;
            inSpace = false;
        }
    }
    out.push_back(makeNode<node::Text>(tok.loc, value));
}

NodePtr TemplateParser::parseInterpolation() {
    const MarkupToken& tok = advance();
    auto parts = splitFilters(tok.text);

    if (isBlank(parts[0])) {
        fail(DiagCode::InvalidMarkup, tok.loc, "empty interpolation");
    }

    node::Interpolation interp;
    interp.expr = makeExpr(parts[0], tok.loc);
    for (size_t i = 1; i < parts.size(); ++i) {
        auto filter = trim(parts[i]);
        if (filter.empty()) {
            fail(DiagCode::InvalidMarkup, tok.loc, "empty filter in interpolation");
        }
        interp.filters.push_back(filter);
    }
    return makeNode<node::Interpolation>(tok.loc, std::move(interp));
}

void TemplateParser::parseLoopHeader(const RawAttr& attr, node::Loop& loop) {
    const std::string& text = attr.value;

    // Find the top-level " in " separator.
    size_t sep = std::string::npos;
    int depth = 0;
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        char c = text[i];
        if (c == '(') ++depth;
        if (c == ')' && depth > 0) --depth;
        if (depth == 0 && text.compare(i, 2, "in") == 0 &&
            i > 0 && std::isspace(static_cast<unsigned char>(text[i - 1])) &&
            i + 2 < text.size() && std::isspace(static_cast<unsigned char>(text[i + 2]))) {
            sep = i;
            break;
        }
    }
    if (sep == std::string::npos) {
        fail(DiagCode::InvalidMarkup, attr.value_loc,
             "invalid p-for expression '" + text + "', expected 'item in items'");
    }

    auto lhs = trim(text.substr(0, sep));
    if (!lhs.empty() && lhs.front() == '(') {
        if (lhs.back() != ')') {
            fail(DiagCode::InvalidMarkup, attr.value_loc, "unbalanced parentheses in p-for binding");
        }
        lhs = lhs.substr(1, lhs.size() - 2);
        auto comma = lhs.find(',');
        if (comma != std::string::npos) {
            loop.index = trim(lhs.substr(comma + 1));
            lhs = lhs.substr(0, comma);
        }
        lhs = trim(lhs);
    }

    if (!isIdentifier(lhs) || (loop.index && !isIdentifier(*loop.index))) {
        fail(DiagCode::InvalidMarkup, attr.value_loc, "invalid p-for binding in '" + text + "'");
    }
    loop.binding = lhs;

    auto rhs = text.substr(sep + 2);
    if (isBlank(rhs)) {
        fail(DiagCode::InvalidMarkup, attr.value_loc, "p-for is missing the iterable expression");
    }
    loop.iterable = makeExpr(rhs, advanceLoc(attr.value_loc, text, sep + 2));
}

NodePtr TemplateParser::parseElement(std::string* elseKind, TemplateExpr* elseCond) {
    const MarkupToken& open = advance();
    std::string tag = open.text;
    SourceLocation loc = open.loc;

    std::vector<RawAttr> attrs;
    while (check(MarkupTokenKind::AttrName)) {
        RawAttr attr;
        attr.name = peek().text;
        attr.loc = peek().loc;
        advance();
        if (check(MarkupTokenKind::AttrValue)) {
            attr.value = peek().text;
            attr.value_loc = peek().loc;
            attr.has_value = true;
            advance();
        }
        attrs.push_back(std::move(attr));
    }

    bool selfClosed = false;
    if (check(MarkupTokenKind::SelfClose)) {
        advance();
        selfClosed = true;
    } else if (check(MarkupTokenKind::TagEnd)) {
        advance();
    } else {
        fail(DiagCode::InvalidMarkup, peek().loc, "expected '>' to close tag <" + tag + ">");
    }

    bool hasFor = false;
    for (const auto& attr : attrs) {
        if (attr.name == "p-for") hasFor = true;
    }

    node::Element element;
    element.tag = tag;
    std::optional<TemplateExpr> ifCond;
    std::optional<TemplateExpr> loopKey;
    const RawAttr* forAttr = nullptr;

    for (const auto& attr : attrs) {
        auto requireValue = [&]() {
            if (!attr.has_value || isBlank(attr.value)) {
                fail(DiagCode::InvalidMarkup, attr.loc, "directive '" + attr.name + "' requires a value");
            }
        };

        if (attr.name == "p-if") {
            requireValue();
            ifCond = makeExpr(attr.value, attr.value_loc);
        } else if (attr.name == "p-else-if") {
            requireValue();
            *elseKind = "p-else-if";
            *elseCond = makeExpr(attr.value, attr.value_loc);
        } else if (attr.name == "p-else") {
            *elseKind = "p-else";
        } else if (attr.name == "p-for") {
            requireValue();
            forAttr = &attr;
        } else if (startsWith(attr.name, ":") || startsWith(attr.name, "p-bind:")) {
            auto arg = attr.name.substr(attr.name[0] == ':' ? 1 : 7);
            if (arg.empty()) fail(DiagCode::InvalidMarkup, attr.loc, "binding without an attribute name");
            requireValue();
            if (arg == "key" && hasFor) {
                loopKey = makeExpr(attr.value, attr.value_loc);
            } else {
                element.directives.push_back(
                    Directive{DirectiveKind::Bind, arg, makeExpr(attr.value, attr.value_loc), attr.loc});
            }
        } else if (startsWith(attr.name, "@") || startsWith(attr.name, "p-on:")) {
            auto arg = attr.name.substr(attr.name[0] == '@' ? 1 : 5);
            if (arg.empty()) fail(DiagCode::InvalidMarkup, attr.loc, "event binding without an event name");
            requireValue();
            element.directives.push_back(
                Directive{DirectiveKind::On, arg, makeExpr(attr.value, attr.value_loc), attr.loc});
        } else if (startsWith(attr.name, "p-")) {
            if (options_.strict_directives) {
                fail(DiagCode::UnknownDirective, attr.loc, "unknown directive '" + attr.name + "'");
            }
            diag_.warning(DiagCode::UnknownDirective, attr.loc,
                          "unknown directive '" + attr.name + "' is ignored");
        } else {
            element.attributes.push_back(Attribute{attr.name, attr.value, attr.has_value, attr.loc});
        }
    }

    if (!elseKind->empty() && (ifCond || forAttr)) {
        fail(DiagCode::InvalidMarkup, loc,
             "'" + *elseKind + "' cannot be combined with 'p-if' or 'p-for'");
    }

    if (!selfClosed && !isVoidElement(tag)) {
        open_.push_back({tag, loc});
        element.children = parseChildren(&tag, &loc);
        open_.pop_back();
        advance(); // matching end tag
    }

    NodePtr result;
    if (tag == "slot") {
        node::Slot slot;
        if (const Attribute* name = element.findAttribute("name")) {
            slot.name = name->value;
        }
        if (!element.directives.empty()) {
            diag_.warning(loc, "bindings on <slot> are ignored");
        }
        slot.fallback = std::move(element.children);
        result = makeNode<node::Slot>(loc, std::move(slot));
    } else {
        result = makeNode<node::Element>(loc, std::move(element));
    }

    if (ifCond) {
        result = makeNode<node::Conditional>(loc, std::move(*ifCond), std::move(result), nullptr);
    }

    if (forAttr) {
        node::Loop loop;
        parseLoopHeader(*forAttr, loop);
        loop.key = std::move(loopKey);
        loop.body = std::move(result);
        result = makeNode<node::Loop>(loc, std::move(loop));
    }

    return result;
}

} // namespace prism
