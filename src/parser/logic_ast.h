#pragma once

#include "common/source_location.h"
#include "parser/expr_ast.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prism {

// ─── Logic section declarations ─────────────────────────────────────

namespace decl {
    struct Import {
        std::string name;       // local component name, e.g. "Card"
        std::string path;       // as written, e.g. "./card"
        std::string unit;       // resolved unit identity, e.g. "components/card"
    };

    struct Prop {
        std::string name;
        std::string type;       // string, int, float, bool, list, map, any
        std::optional<ExprPtr> default_value;
    };

    struct State {
        std::string name;
        std::string type;
        std::optional<ExprPtr> initial;
    };

    struct Method {
        std::string name;
    };
}

using DeclKind = std::variant<
    decl::Import,
    decl::Prop,
    decl::State,
    decl::Method
>;

struct Decl {
    DeclKind kind;
    SourceLocation loc;
};

struct LogicSection {
    std::vector<Decl> decls;
};

bool isKnownValueType(const std::string& type);

} // namespace prism
