#pragma once

#include "common/source_location.h"
#include "lexer/token.h"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prism {

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

// ─── Expressions ────────────────────────────────────────────────────
// Template and default-value expressions. Deliberately small: no
// assignment, no calls except through filters.

namespace expr {
    struct Ident       { std::string name; };
    struct StringLit   { std::string value; };
    struct IntLit      { std::string value; };  // Keep as written for faithful codegen
    struct FloatLit    { std::string value; };
    struct BoolLit     { bool value; };
    struct NullLit     {};
    struct ListLit     { std::vector<ExprPtr> elements; };
    struct MapEntry    { std::string key; ExprPtr value; };
    struct MapLit      { std::vector<MapEntry> entries; };
    struct Member      { ExprPtr object; std::string member; };     // obj.field
    struct Index       { ExprPtr object; ExprPtr index; };          // a[i]
    struct Unary       { TokenKind op; ExprPtr operand; };
    struct Binary      { ExprPtr left; TokenKind op; ExprPtr right; };
    struct Ternary     { ExprPtr cond; ExprPtr then_value; ExprPtr else_value; };
    struct Filter      { ExprPtr input; std::string name; std::vector<ExprPtr> args; };  // a | f(b)
}

using ExprKind = std::variant<
    expr::Ident,
    expr::StringLit,
    expr::IntLit,
    expr::FloatLit,
    expr::BoolLit,
    expr::NullLit,
    expr::ListLit,
    expr::MapLit,
    expr::Member,
    expr::Index,
    expr::Unary,
    expr::Binary,
    expr::Ternary,
    expr::Filter
>;

struct Expr {
    ExprKind kind;
    SourceLocation loc;
};

template<typename T, typename... Args>
ExprPtr makeExpr(SourceLocation loc, Args&&... args) {
    return std::make_unique<Expr>(Expr{T{std::forward<Args>(args)...}, loc});
}

// Render an expression back to source form (used by codegen comments and tests).
std::string exprToString(const Expr& e);

} // namespace prism
