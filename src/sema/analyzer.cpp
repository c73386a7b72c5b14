#include "sema/analyzer.h"
#include "parser/expr_parser.h"

#include <variant>

namespace prism {

static const char* const kBuiltinFilters[] = {
    "upper", "lower", "trim", "length", "default", "json",
};

Analyzer::Analyzer(std::string unit, DiagnosticEngine& diag)
    : unit_(std::move(unit)), diag_(diag) {
    registerBuiltins();
}

void Analyzer::registerBuiltins() {
    for (const char* name : kBuiltinFilters) {
        symbols_.define(name, Symbol{name, SymbolKind::Filter, {}, "builtin"});
    }
}

std::optional<SemanticModel> Analyzer::analyze(const LogicSection* logic, const Template* markup,
                                               const DependencyMap& dependencies,
                                               const std::string& scopeToken) {
    int before = diag_.errorCount();
    dependencies_ = &dependencies;
    model_ = SemanticModel{};
    model_.interface.unit = unit_;
    model_.interface.scope_token = scopeToken;

    if (!logic) {
        diag_.error(DiagCode::MissingLogicSection, SourceLocation{unit_, 1, 1, 0},
                    "unit '" + unit_ + "' has no <script> section declaring its props");
        return std::nullopt;
    }

    // Unit declarations shadow built-ins. The unit scope stays current so
    // the table can be inspected after analysis.
    symbols_.enterScope();

    for (const auto& decl : logic->decls) {
        registerDecl(decl);
    }

    if (markup) {
        model_.exprs.resize(markup->expr_count);
        checkNodes(markup->roots);
    }

    if (diag_.errorCount() != before) return std::nullopt;
    return std::move(model_);
}

// ─── Declarations ───────────────────────────────────────────────────

void Analyzer::registerDecl(const Decl& decl) {
    std::visit([this, &decl](const auto& d) {
        using T = std::decay_t<decltype(d)>;

        SymbolKind kind;
        std::string typeName;
        if constexpr (std::is_same_v<T, decl::Import>) {
            kind = SymbolKind::Component;
            typeName = d.unit;
        } else if constexpr (std::is_same_v<T, decl::Prop>) {
            kind = SymbolKind::Prop;
            typeName = d.type;
        } else if constexpr (std::is_same_v<T, decl::State>) {
            kind = SymbolKind::State;
            typeName = d.type;
        } else {
            kind = SymbolKind::Method;
        }

        if (Symbol* existing = symbols_.lookupLocal(d.name)) {
            diag_.error(DiagCode::DuplicateDeclaration, decl.loc,
                        "'" + d.name + "' is already declared as a " +
                        symbolKindName(existing->kind));
            diag_.note(existing->loc, "previous declaration is here");
            return;
        }
        symbols_.define(d.name, Symbol{d.name, kind, decl.loc, typeName});

        if constexpr (std::is_same_v<T, decl::Import>) {
            checkImport(d, decl.loc);
        } else if constexpr (std::is_same_v<T, decl::Prop> || std::is_same_v<T, decl::State>) {
            if (!isKnownValueType(d.type)) {
                diag_.error(DiagCode::UnresolvedSymbol, decl.loc,
                            "unknown type '" + d.type + "' for '" + d.name + "'");
            }
            const std::optional<ExprPtr>* value;
            if constexpr (std::is_same_v<T, decl::Prop>) {
                value = &d.default_value;
            } else {
                value = &d.initial;
            }
            if (*value) checkDefault(***value);

            if constexpr (std::is_same_v<T, decl::Prop>) {
                PropInfo info;
                info.name = d.name;
                info.type = d.type;
                info.required = !d.default_value.has_value();
                if (d.default_value) info.default_value = exprToString(**d.default_value);
                model_.interface.props.push_back(std::move(info));
            }
        }
    }, decl.kind);
}

// Defaults and initial values are evaluated before any prop or state
// exists, so they may only use literals.
void Analyzer::checkDefault(const Expr& value) {
    std::visit([this, &value](const auto& x) {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, expr::Ident>) {
            diag_.error(DiagCode::UnresolvedSymbol, value.loc,
                        "default values must be constant, '" + x.name + "' is not");
        } else if constexpr (std::is_same_v<T, expr::ListLit>) {
            for (const auto& el : x.elements) checkDefault(*el);
        } else if constexpr (std::is_same_v<T, expr::MapLit>) {
            for (const auto& entry : x.entries) checkDefault(*entry.value);
        } else if constexpr (std::is_same_v<T, expr::Member>) {
            checkDefault(*x.object);
        } else if constexpr (std::is_same_v<T, expr::Index>) {
            checkDefault(*x.object);
            checkDefault(*x.index);
        } else if constexpr (std::is_same_v<T, expr::Unary>) {
            checkDefault(*x.operand);
        } else if constexpr (std::is_same_v<T, expr::Binary>) {
            checkDefault(*x.left);
            checkDefault(*x.right);
        } else if constexpr (std::is_same_v<T, expr::Ternary>) {
            checkDefault(*x.cond);
            checkDefault(*x.then_value);
            checkDefault(*x.else_value);
        }
    }, value.kind);
}

void Analyzer::checkImport(const decl::Import& import, const SourceLocation& loc) {
    if (import.unit == unit_) {
        diag_.error(DiagCode::CircularDependency, loc, "unit '" + unit_ + "' imports itself");
        return;
    }

    auto it = dependencies_->find(import.unit);
    if (it == dependencies_->end()) {
        diag_.error(DiagCode::DependencyFailed, loc,
                    "imported unit '" + import.unit + "' does not exist");
        return;
    }
    if (!it->second) {
        diag_.error(DiagCode::DependencyFailed, loc,
                    "imported unit '" + import.unit + "' failed to compile");
        return;
    }
    model_.components[import.name] = import.unit;
}

// ─── Template ───────────────────────────────────────────────────────

void Analyzer::checkNodes(const std::vector<NodePtr>& nodes) {
    for (const auto& node : nodes) {
        checkNode(*node);
    }
}

void Analyzer::checkNode(const TemplateNode& node) {
    std::visit([this, &node](const auto& n) {
        using T = std::decay_t<decltype(n)>;

        if constexpr (std::is_same_v<T, node::Element>) {
            checkElement(n, node.loc);
        } else if constexpr (std::is_same_v<T, node::Interpolation>) {
            std::string source = n.expr.text;
            for (const auto& filter : n.filters) {
                source += " | " + filter;
            }
            parseExpr(n.expr, source);
        } else if constexpr (std::is_same_v<T, node::Conditional>) {
            parseExpr(n.cond, n.cond.text);
            checkNode(*n.then_branch);
            if (n.else_branch) checkNode(*n.else_branch);
        } else if constexpr (std::is_same_v<T, node::Loop>) {
            parseExpr(n.iterable, n.iterable.text);

            symbols_.enterScope();
            symbols_.define(n.binding, Symbol{n.binding, SymbolKind::LoopVar, node.loc, "any"});
            if (n.index) {
                if (!symbols_.define(*n.index, Symbol{*n.index, SymbolKind::LoopVar, node.loc, "int"})) {
                    diag_.error(DiagCode::DuplicateDeclaration, node.loc,
                                "loop index '" + *n.index + "' repeats the loop binding");
                }
            }
            if (n.key) parseExpr(*n.key, n.key->text);
            checkNode(*n.body);
            symbols_.exitScope();
        } else if constexpr (std::is_same_v<T, node::Slot>) {
            if (!model_.interface.hasSlot(n.name)) {
                model_.interface.slots.push_back(n.name);
            }
            checkNodes(n.fallback);
        }
    }, node.kind);
}

void Analyzer::checkElement(const node::Element& el, const SourceLocation& loc) {
    for (const auto& dir : el.directives) {
        if (dir.kind == DirectiveKind::On) {
            checkHandler(dir);
        } else {
            parseExpr(dir.expr, dir.expr.text);
        }
    }

    if (isComponentTag(el.tag)) {
        Symbol* sym = symbols_.lookupKind(el.tag, SymbolKind::Component);
        if (!sym) {
            diag_.error(DiagCode::UnresolvedSymbol, loc,
                        "unknown component <" + el.tag + ">, did you forget to import it?");
        } else {
            auto it = dependencies_->find(sym->type_name);
            if (it != dependencies_->end() && it->second) {
                checkComponentUsage(el, *it->second, loc);
            }
        }
    }

    checkNodes(el.children);
}

void Analyzer::checkComponentUsage(const node::Element& el, const ComponentInterface& iface,
                                   const SourceLocation& loc) {
    auto supplied = [&el](const std::string& name) {
        if (el.findAttribute(name)) return true;
        for (const auto& dir : el.directives) {
            if (dir.kind == DirectiveKind::Bind && dir.arg == name) return true;
        }
        return false;
    };

    for (const auto& prop : iface.props) {
        if (prop.required && !supplied(prop.name)) {
            diag_.error(DiagCode::MissingRequiredProp, loc,
                        "<" + el.tag + "> is missing required prop '" + prop.name + "'");
        }
    }

    for (const auto& attr : el.attributes) {
        if (attr.name != "slot" && !iface.findProp(attr.name)) {
            diag_.warning(DiagCode::UnknownProp, attr.loc,
                          "<" + el.tag + "> has no prop '" + attr.name + "'");
        }
    }
    for (const auto& dir : el.directives) {
        if (dir.kind == DirectiveKind::Bind && !iface.findProp(dir.arg)) {
            diag_.warning(DiagCode::UnknownProp, dir.loc,
                          "<" + el.tag + "> has no prop '" + dir.arg + "'");
        }
    }

    for (const auto& child : el.children) {
        if (std::holds_alternative<node::Text>(child->kind) && iface.hasSlot("")) continue;
        std::string target = slotTargetOf(*child);
        if (!iface.hasSlot(target)) {
            diag_.warning(DiagCode::UnknownSlot, child->loc,
                          target.empty()
                              ? "<" + el.tag + "> has no default slot, content is dropped"
                              : "<" + el.tag + "> has no slot named '" + target + "'");
        }
    }
}

void Analyzer::checkHandler(const Directive& dir) {
    Symbol* sym = symbols_.lookup(dir.expr.text);
    if (!sym || sym->kind != SymbolKind::Method) {
        diag_.error(DiagCode::UnresolvedSymbol, dir.expr.loc,
                    "event handler '" + dir.expr.text + "' for '" + dir.arg + "' is not a declared method");
        return;
    }
    model_.exprs[dir.expr.id] = makeExpr<expr::Ident>(dir.expr.loc, dir.expr.text);
}

// ─── Expressions ────────────────────────────────────────────────────

void Analyzer::parseExpr(const TemplateExpr& te, const std::string& source) {
    auto parsed = ExprParser::parseString(source, te.loc, diag_);
    if (!parsed) return;
    resolveExpr(*parsed);
    model_.exprs[te.id] = std::move(parsed);
}

void Analyzer::resolveExpr(const Expr& e) {
    std::visit([this, &e](const auto& x) {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, expr::Ident>) {
            Symbol* sym = symbols_.lookup(x.name);
            if (!sym) {
                diag_.error(DiagCode::UnresolvedSymbol, e.loc, "unresolved identifier '" + x.name + "'");
            } else if (sym->kind == SymbolKind::Method || sym->kind == SymbolKind::Component ||
                       sym->kind == SymbolKind::Filter) {
                diag_.error(DiagCode::InvalidExpression, e.loc,
                            "'" + x.name + "' is a " + symbolKindName(sym->kind) +
                            " and cannot be used as a value");
            }
        } else if constexpr (std::is_same_v<T, expr::ListLit>) {
            for (const auto& el : x.elements) resolveExpr(*el);
        } else if constexpr (std::is_same_v<T, expr::MapLit>) {
            for (const auto& entry : x.entries) resolveExpr(*entry.value);
        } else if constexpr (std::is_same_v<T, expr::Member>) {
            resolveExpr(*x.object);
        } else if constexpr (std::is_same_v<T, expr::Index>) {
            resolveExpr(*x.object);
            resolveExpr(*x.index);
        } else if constexpr (std::is_same_v<T, expr::Unary>) {
            resolveExpr(*x.operand);
        } else if constexpr (std::is_same_v<T, expr::Binary>) {
            resolveExpr(*x.left);
            resolveExpr(*x.right);
        } else if constexpr (std::is_same_v<T, expr::Ternary>) {
            resolveExpr(*x.cond);
            resolveExpr(*x.then_value);
            resolveExpr(*x.else_value);
        } else if constexpr (std::is_same_v<T, expr::Filter>) {
            resolveExpr(*x.input);
            if (!symbols_.lookupKind(x.name, SymbolKind::Filter)) {
                diag_.error(DiagCode::UnresolvedSymbol, e.loc, "unknown filter '" + x.name + "'");
            }
            for (const auto& arg : x.args) resolveExpr(*arg);
        }
    }, e.kind);
}

} // namespace prism
