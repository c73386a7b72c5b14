#include "parser/expr_parser.h"
#include "lexer/logic_lexer.h"

#include <sstream>

namespace prism {

ExprParser::ExprParser(const std::vector<Token>& tokens, size_t& pos, DiagnosticEngine& diag)
    : tokens_(tokens), pos_(pos), diag_(diag) {}

// ─── Token stream ───────────────────────────────────────────────────

const Token& ExprParser::peek() const {
    return tokens_[pos_];
}

const Token& ExprParser::advance() {
    const Token& tok = tokens_[pos_];
    if (pos_ < tokens_.size() - 1) ++pos_;
    return tok;
}

bool ExprParser::check(TokenKind kind) const {
    return peek().kind == kind;
}

bool ExprParser::match(TokenKind kind) {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

bool ExprParser::expect(TokenKind kind, const std::string& msg) {
    if (match(kind)) return true;
    if (!failed_) {
        diag_.error(DiagCode::InvalidExpression, peek().loc,
                    msg + ", got '" + (peek().is(TokenKind::Eof) ? "end of expression" : peek().text) + "'");
        failed_ = true;
    }
    return false;
}

// ─── Expressions ────────────────────────────────────────────────────

ExprPtr ExprParser::parseExpr() {
    auto result = parseTernary();

    // Filter chain: value | name | name(arg, ...)
    while (check(TokenKind::Pipe)) {
        auto pipeLoc = peek().loc;
        advance();
        if (!check(TokenKind::Ident)) {
            expect(TokenKind::Ident, "expected filter name after '|'");
            return result;
        }
        auto name = advance().text;
        std::vector<ExprPtr> args;
        if (match(TokenKind::LParen)) {
            if (!check(TokenKind::RParen)) {
                do {
                    args.push_back(parseTernary());
                } while (match(TokenKind::Comma));
            }
            expect(TokenKind::RParen, "expected ')' after filter arguments");
        }
        result = makeExpr<expr::Filter>(pipeLoc, std::move(result), name, std::move(args));
    }
    return result;
}

ExprPtr ExprParser::parseTernary() {
    auto cond = parseOr();
    if (check(TokenKind::Question)) {
        auto qLoc = peek().loc;
        advance();
        auto thenValue = parseTernary();
        expect(TokenKind::Colon, "expected ':' in conditional expression");
        auto elseValue = parseTernary();
        return makeExpr<expr::Ternary>(qLoc, std::move(cond), std::move(thenValue), std::move(elseValue));
    }
    return cond;
}

ExprPtr ExprParser::parseOr() {
    auto left = parseAnd();
    while (check(TokenKind::PipePipe)) {
        auto opLoc = peek().loc;
        advance();
        auto right = parseAnd();
        left = std::make_unique<Expr>(Expr{
            expr::Binary{std::move(left), TokenKind::PipePipe, std::move(right)}, opLoc});
    }
    return left;
}

ExprPtr ExprParser::parseAnd() {
    auto left = parseComparison();
    while (check(TokenKind::AmpAmp)) {
        auto opLoc = peek().loc;
        advance();
        auto right = parseComparison();
        left = std::make_unique<Expr>(Expr{
            expr::Binary{std::move(left), TokenKind::AmpAmp, std::move(right)}, opLoc});
    }
    return left;
}

ExprPtr ExprParser::parseComparison() {
    auto left = parseAddition();
    while (check(TokenKind::Equal) || check(TokenKind::NotEqual) ||
           check(TokenKind::Less) || check(TokenKind::Greater) ||
           check(TokenKind::LessEqual) || check(TokenKind::GreaterEqual)) {
        auto opLoc = peek().loc;
        auto op = advance().kind;
        auto right = parseAddition();
        left = std::make_unique<Expr>(Expr{
            expr::Binary{std::move(left), op, std::move(right)}, opLoc});
    }
    return left;
}

ExprPtr ExprParser::parseAddition() {
    auto left = parseMultiplication();
    while (check(TokenKind::Plus) || check(TokenKind::Minus)) {
        auto opLoc = peek().loc;
        auto op = advance().kind;
        auto right = parseMultiplication();
        left = std::make_unique<Expr>(Expr{
            expr::Binary{std::move(left), op, std::move(right)}, opLoc});
    }
    return left;
}

ExprPtr ExprParser::parseMultiplication() {
    auto left = parseUnary();
    while (check(TokenKind::Star) || check(TokenKind::Slash) || check(TokenKind::Percent)) {
        auto opLoc = peek().loc;
        auto op = advance().kind;
        auto right = parseUnary();
        left = std::make_unique<Expr>(Expr{
            expr::Binary{std::move(left), op, std::move(right)}, opLoc});
    }
    return left;
}

ExprPtr ExprParser::parseUnary() {
    if (check(TokenKind::Minus) || check(TokenKind::Bang)) {
        auto opLoc = peek().loc;
        auto op = advance().kind;
        auto operand = parseUnary();
        return std::make_unique<Expr>(Expr{expr::Unary{op, std::move(operand)}, opLoc});
    }
    return parsePostfix();
}

ExprPtr ExprParser::parsePostfix() {
    auto result = parsePrimary();

    while (true) {
        if (check(TokenKind::Dot)) {
            auto dotLoc = peek().loc;
            advance();
            if (!check(TokenKind::Ident)) {
                expect(TokenKind::Ident, "expected member name after '.'");
                break;
            }
            auto member = advance().text;
            result = std::make_unique<Expr>(Expr{
                expr::Member{std::move(result), member}, dotLoc});
        } else if (check(TokenKind::LBracket)) {
            auto idxLoc = peek().loc;
            advance();
            auto index = parseTernary();
            expect(TokenKind::RBracket, "expected ']'");
            result = std::make_unique<Expr>(Expr{
                expr::Index{std::move(result), std::move(index)}, idxLoc});
        } else if (check(TokenKind::LParen)) {
            if (!failed_) {
                diag_.error(DiagCode::InvalidExpression, peek().loc,
                            "function calls are not allowed in template expressions; use a filter");
                failed_ = true;
            }
            break;
        } else {
            break;
        }
    }

    return result;
}

ExprPtr ExprParser::parsePrimary() {
    auto location = peek().loc;

    // Parenthesized expression
    if (match(TokenKind::LParen)) {
        auto inner = parseExpr();
        expect(TokenKind::RParen, "expected ')'");
        return inner;
    }

    // List literal: [a, b]
    if (match(TokenKind::LBracket)) {
        std::vector<ExprPtr> elements;
        if (!check(TokenKind::RBracket)) {
            do {
                elements.push_back(parseTernary());
            } while (match(TokenKind::Comma) && !check(TokenKind::RBracket));
        }
        expect(TokenKind::RBracket, "expected ']' after list elements");
        return makeExpr<expr::ListLit>(location, std::move(elements));
    }

    // Map literal: {key: value, "other key": value}
    if (match(TokenKind::LBrace)) {
        std::vector<expr::MapEntry> entries;
        while (!check(TokenKind::RBrace) && !check(TokenKind::Eof) && !failed_) {
            std::string key;
            if (check(TokenKind::Ident) || check(TokenKind::StringLit)) {
                key = advance().text;
            } else {
                expect(TokenKind::Ident, "expected map key");
                break;
            }
            expect(TokenKind::Colon, "expected ':' after map key");
            entries.push_back(expr::MapEntry{key, parseTernary()});
            if (!match(TokenKind::Comma)) break;
        }
        expect(TokenKind::RBrace, "expected '}' after map entries");
        return makeExpr<expr::MapLit>(location, std::move(entries));
    }

    // Literals
    if (check(TokenKind::IntLit)) {
        auto val = advance().text;
        return std::make_unique<Expr>(Expr{expr::IntLit{val}, location});
    }
    if (check(TokenKind::FloatLit)) {
        auto val = advance().text;
        return std::make_unique<Expr>(Expr{expr::FloatLit{val}, location});
    }
    if (check(TokenKind::StringLit)) {
        auto val = advance().text;
        return std::make_unique<Expr>(Expr{expr::StringLit{val}, location});
    }
    if (check(TokenKind::True)) {
        advance();
        return std::make_unique<Expr>(Expr{expr::BoolLit{true}, location});
    }
    if (check(TokenKind::False)) {
        advance();
        return std::make_unique<Expr>(Expr{expr::BoolLit{false}, location});
    }
    if (check(TokenKind::Null)) {
        advance();
        return std::make_unique<Expr>(Expr{expr::NullLit{}, location});
    }

    if (check(TokenKind::Ident)) {
        auto name = advance().text;
        return std::make_unique<Expr>(Expr{expr::Ident{name}, location});
    }

    if (!failed_) {
        diag_.error(DiagCode::InvalidExpression, location,
                    "expected expression, got '" +
                    (peek().is(TokenKind::Eof) ? std::string("end of expression") : peek().text) + "'");
        failed_ = true;
    }
    advance();
    return std::make_unique<Expr>(Expr{expr::NullLit{}, location});
}

ExprPtr ExprParser::parseString(const std::string& text, const SourceLocation& loc,
                                DiagnosticEngine& diag) {
    int before = diag.errorCount();
    auto tokens = LogicLexer(text, loc, diag, false).tokenize();
    if (diag.errorCount() != before) return nullptr;

    if (tokens.size() == 1) {
        diag.error(DiagCode::InvalidExpression, loc, "empty expression");
        return nullptr;
    }

    size_t pos = 0;
    ExprParser parser(tokens, pos, diag);
    auto result = parser.parseExpr();
    if (diag.errorCount() != before) return nullptr;

    if (!tokens[pos].is(TokenKind::Eof)) {
        diag.error(DiagCode::InvalidExpression, tokens[pos].loc,
                   "unexpected '" + tokens[pos].text + "' after expression");
        return nullptr;
    }
    return result;
}

// ─── Printing ───────────────────────────────────────────────────────

static void printExpr(std::ostringstream& out, const Expr& e);

static std::string quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        switch (c) {
            case '\'': out += "\\'"; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    return out + "'";
}

static void printExpr(std::ostringstream& out, const Expr& e) {
    std::visit([&out](const auto& x) {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, expr::Ident>) {
            out << x.name;
        } else if constexpr (std::is_same_v<T, expr::StringLit>) {
            out << quote(x.value);
        } else if constexpr (std::is_same_v<T, expr::IntLit> || std::is_same_v<T, expr::FloatLit>) {
            out << x.value;
        } else if constexpr (std::is_same_v<T, expr::BoolLit>) {
            out << (x.value ? "true" : "false");
        } else if constexpr (std::is_same_v<T, expr::NullLit>) {
            out << "null";
        } else if constexpr (std::is_same_v<T, expr::ListLit>) {
            out << "[";
            for (size_t i = 0; i < x.elements.size(); ++i) {
                if (i > 0) out << ", ";
                printExpr(out, *x.elements[i]);
            }
            out << "]";
        } else if constexpr (std::is_same_v<T, expr::MapLit>) {
            out << "{";
            for (size_t i = 0; i < x.entries.size(); ++i) {
                if (i > 0) out << ", ";
                out << quote(x.entries[i].key) << ": ";
                printExpr(out, *x.entries[i].value);
            }
            out << "}";
        } else if constexpr (std::is_same_v<T, expr::Member>) {
            printExpr(out, *x.object);
            out << "." << x.member;
        } else if constexpr (std::is_same_v<T, expr::Index>) {
            printExpr(out, *x.object);
            out << "[";
            printExpr(out, *x.index);
            out << "]";
        } else if constexpr (std::is_same_v<T, expr::Unary>) {
            out << tokenKindName(x.op);
            printExpr(out, *x.operand);
        } else if constexpr (std::is_same_v<T, expr::Binary>) {
            out << "(";
            printExpr(out, *x.left);
            out << " " << tokenKindName(x.op) << " ";
            printExpr(out, *x.right);
            out << ")";
        } else if constexpr (std::is_same_v<T, expr::Ternary>) {
            out << "(";
            printExpr(out, *x.cond);
            out << " ? ";
            printExpr(out, *x.then_value);
            out << " : ";
            printExpr(out, *x.else_value);
            out << ")";
        } else if constexpr (std::is_same_v<T, expr::Filter>) {
            printExpr(out, *x.input);
            out << " | " << x.name;
            if (!x.args.empty()) {
                out << "(";
                for (size_t i = 0; i < x.args.size(); ++i) {
                    if (i > 0) out << ", ";
                    printExpr(out, *x.args[i]);
                }
                out << ")";
            }
        }
    }, e.kind);
}

std::string exprToString(const Expr& e) {
    std::ostringstream out;
    printExpr(out, e);
    return out.str();
}

} // namespace prism
