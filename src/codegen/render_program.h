#pragma once

#include "common/source_location.h"
#include "parser/logic_ast.h"
#include "parser/template_ast.h"
#include "runtime/render_node.h"
#include "runtime/value.h"
#include "sema/analyzer.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace prism {

struct RenderOp;
using OpPtr = std::unique_ptr<RenderOp>;
using OpList = std::vector<OpPtr>;

// ─── Render operations ──────────────────────────────────────────────
// The lowered template. Expressions are referenced by their id in the
// program's expression table.

namespace op {
    struct StaticAttr { std::string name; Value value; };
    struct BoundAttr  { std::string name; uint32_t expr; };
    struct Event      { std::string name; std::string method; };

    // Literal text, or an expression rendered with Value::display().
    struct TextPart {
        bool is_expr = false;
        std::string literal;
        uint32_t expr = 0;
    };

    struct Element {
        std::string tag;
        std::vector<StaticAttr> static_attrs;
        std::vector<BoundAttr> bound_attrs;
        std::vector<Event> events;
        OpList children;
    };

    struct Text {
        std::vector<TextPart> parts;
    };

    struct Component {
        std::string name;
        std::string unit;
        std::vector<StaticAttr> static_props;
        std::vector<BoundAttr> bound_props;
        std::vector<Event> events;
        std::map<std::string, OpList> slots;
    };

    // if / else-if arms in order; `otherwise` is the p-else arm.
    struct Branch {
        std::vector<std::pair<uint32_t, OpList>> arms;
        std::optional<OpList> otherwise;
    };

    struct Each {
        std::string binding;
        std::optional<std::string> index;
        uint32_t iterable = 0;
        std::optional<uint32_t> key;
        OpList body;
    };

    struct SlotOutlet {
        std::string name;
        OpList fallback;
    };
}

using OpKind = std::variant<
    op::Element,
    op::Text,
    op::Component,
    op::Branch,
    op::Each,
    op::SlotOutlet
>;

struct RenderOp {
    OpKind kind;
    SourceLocation loc;
};

struct PropSlot {
    std::string name;
    std::string type;
    ExprPtr default_value;  // null when required
};

struct StateSlot {
    std::string name;
    std::string type;
    ExprPtr initial;        // null renders as null
};

// Executable render routine of one unit. Rendering is pure: the same
// input always yields an equal tree.
class RenderProgram {
public:
    // `markup` may be null for a unit without a markup section.
    static RenderProgram lower(const Template* markup, SemanticModel model, LogicSection logic);

    std::vector<RenderNode> render(const RenderInput& input) const;

    const std::string& unit() const { return interface_.unit; }
    const std::string& scopeToken() const { return interface_.scope_token; }
    const ComponentInterface& interface() const { return interface_; }
    const OpList& ops() const { return ops_; }
    const std::vector<PropSlot>& props() const { return props_; }
    const std::vector<StateSlot>& state() const { return state_; }
    const Expr& expr(uint32_t id) const;

private:
    ComponentInterface interface_;
    std::vector<ExprPtr> exprs_;
    std::map<std::string, std::string> components_;
    std::vector<PropSlot> props_;
    std::vector<StateSlot> state_;
    OpList ops_;

    friend class Lowering;
};

} // namespace prism
