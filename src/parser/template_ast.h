#pragma once

#include "common/source_location.h"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prism {

struct TemplateNode;
using NodePtr = std::unique_ptr<TemplateNode>;

// An expression captured verbatim from markup. `id` indexes the analyzer's
// expression table; ids are dense and assigned in document order.
struct TemplateExpr {
    std::string text;
    SourceLocation loc;
    uint32_t id = 0;
};

struct Attribute {
    std::string name;
    std::string value;
    bool has_value = true;  // false for bare boolean attributes: <input disabled>
    SourceLocation loc;
};

enum class DirectiveKind {
    Bind,   // :name="expr" or p-bind:name="expr"
    On,     // @name="handler" or p-on:name="handler"
};

struct Directive {
    DirectiveKind kind;
    std::string arg;        // attribute or event name
    TemplateExpr expr;
    SourceLocation loc;
};

// ─── Template nodes ─────────────────────────────────────────────────

namespace node {
    struct Element {
        std::string tag;
        std::vector<Attribute> attributes;
        std::vector<Directive> directives;
        std::vector<NodePtr> children;

        const Attribute* findAttribute(const std::string& name) const;
    };

    struct Text {
        std::string value;
    };

    struct Interpolation {
        TemplateExpr expr;                  // expression before the first filter
        std::vector<std::string> filters;   // "upper", "default('n/a')"
    };

    struct Conditional {
        TemplateExpr cond;
        NodePtr then_branch;
        NodePtr else_branch;    // null, another Conditional (p-else-if) or a node (p-else)
    };

    struct Loop {
        std::string binding;
        std::optional<std::string> index;
        TemplateExpr iterable;
        std::optional<TemplateExpr> key;
        NodePtr body;
    };

    struct Slot {
        std::string name;                   // empty for the default slot
        std::vector<NodePtr> fallback;
    };
}

using NodeKind = std::variant<
    node::Element,
    node::Text,
    node::Interpolation,
    node::Conditional,
    node::Loop,
    node::Slot
>;

struct TemplateNode {
    NodeKind kind;
    SourceLocation loc;
};

// The markup section: a forest, roots kept in document order.
struct Template {
    std::vector<NodePtr> roots;
    uint32_t expr_count = 0;
};

template<typename T, typename... Args>
NodePtr makeNode(SourceLocation loc, Args&&... args) {
    return std::make_unique<TemplateNode>(TemplateNode{T{std::forward<Args>(args)...}, loc});
}

// Structural comparison: ignores source locations and expression ids.
bool structurallyEqual(const TemplateNode& a, const TemplateNode& b);
bool structurallyEqual(const std::vector<NodePtr>& a, const std::vector<NodePtr>& b);

bool isVoidElement(const std::string& tag);

// Capitalised tags name imported components.
bool isComponentTag(const std::string& tag);

// The slot a child of a component usage fills: the `slot` attribute of the
// element, looking through p-if and p-for wrappers. Empty for the default
// slot.
std::string slotTargetOf(const TemplateNode& node);

} // namespace prism
