#include "codegen/render_program.h"
#include "runtime/ops.h"
#include "style/selector_scoper.h"

#include <stdexcept>

namespace prism {

// ─── Lowering ───────────────────────────────────────────────────────

class Lowering {
public:
    explicit Lowering(RenderProgram& program) : program_(program) {}

    OpList lowerNodes(const std::vector<const TemplateNode*>& nodes, bool slotContent);
    OpList lowerNodes(const std::vector<NodePtr>& nodes, bool slotContent);

private:
    OpPtr lowerNode(const TemplateNode& node, bool slotContent);
    OpPtr lowerElement(const node::Element& el, const SourceLocation& loc, bool slotContent);
    OpPtr lowerComponent(const node::Element& el, const std::string& unit, const SourceLocation& loc);
    OpPtr lowerBranch(const node::Conditional& cond, const SourceLocation& loc, bool slotContent);
    static op::StaticAttr staticAttr(const Attribute& attr);

    RenderProgram& program_;
};

static OpPtr makeOp(OpKind kind, const SourceLocation& loc) {
    return std::make_unique<RenderOp>(RenderOp{std::move(kind), loc});
}

op::StaticAttr Lowering::staticAttr(const Attribute& attr) {
    if (!attr.has_value) return op::StaticAttr{attr.name, Value(true)};
    return op::StaticAttr{attr.name, Value(attr.value)};
}

OpList Lowering::lowerNodes(const std::vector<NodePtr>& nodes, bool slotContent) {
    std::vector<const TemplateNode*> raw;
    raw.reserve(nodes.size());
    for (const auto& node : nodes) raw.push_back(node.get());
    return lowerNodes(raw, slotContent);
}

// Runs of text and interpolations become a single Text op.
OpList Lowering::lowerNodes(const std::vector<const TemplateNode*>& nodes, bool slotContent) {
    OpList ops;
    op::Text* run = nullptr;

    for (const TemplateNode* node : nodes) {
        if (auto* text = std::get_if<node::Text>(&node->kind)) {
            if (!run) {
                ops.push_back(makeOp(op::Text{}, node->loc));
                run = &std::get<op::Text>(ops.back()->kind);
            }
            if (!run->parts.empty() && !run->parts.back().is_expr) {
                run->parts.back().literal += text->value;
            } else {
                run->parts.push_back(op::TextPart{false, text->value, 0});
            }
            continue;
        }
        if (auto* interp = std::get_if<node::Interpolation>(&node->kind)) {
            if (!run) {
                ops.push_back(makeOp(op::Text{}, node->loc));
                run = &std::get<op::Text>(ops.back()->kind);
            }
            run->parts.push_back(op::TextPart{true, "", interp->expr.id});
            continue;
        }

        run = nullptr;
        ops.push_back(lowerNode(*node, slotContent));
    }
    return ops;
}

OpPtr Lowering::lowerNode(const TemplateNode& node, bool slotContent) {
    return std::visit([this, &node, slotContent](const auto& n) -> OpPtr {
        using T = std::decay_t<decltype(n)>;

        if constexpr (std::is_same_v<T, node::Element>) {
            return lowerElement(n, node.loc, slotContent);
        } else if constexpr (std::is_same_v<T, node::Conditional>) {
            return lowerBranch(n, node.loc, slotContent);
        } else if constexpr (std::is_same_v<T, node::Loop>) {
            op::Each each;
            each.binding = n.binding;
            each.index = n.index;
            each.iterable = n.iterable.id;
            if (n.key) each.key = n.key->id;
            each.body.push_back(lowerNode(*n.body, slotContent));
            return makeOp(std::move(each), node.loc);
        } else if constexpr (std::is_same_v<T, node::Slot>) {
            op::SlotOutlet outlet;
            outlet.name = n.name;
            outlet.fallback = lowerNodes(n.fallback, false);
            return makeOp(std::move(outlet), node.loc);
        } else {
            // Text and interpolations outside a run only reach here alone.
            std::vector<const TemplateNode*> single{&node};
            auto ops = lowerNodes(single, slotContent);
            return std::move(ops.front());
        }
    }, node.kind);
}

OpPtr Lowering::lowerElement(const node::Element& el, const SourceLocation& loc, bool slotContent) {
    auto component = program_.components_.find(el.tag);
    if (isComponentTag(el.tag) && component != program_.components_.end()) {
        return lowerComponent(el, component->second, loc);
    }

    op::Element out;
    out.tag = el.tag;
    for (const auto& attr : el.attributes) {
        if (slotContent && attr.name == "slot") continue;
        out.static_attrs.push_back(staticAttr(attr));
    }
    for (const auto& dir : el.directives) {
        if (dir.kind == DirectiveKind::Bind) {
            out.bound_attrs.push_back(op::BoundAttr{dir.arg, dir.expr.id});
        } else {
            out.events.push_back(op::Event{dir.arg, dir.expr.text});
        }
    }
    out.children = lowerNodes(el.children, false);
    return makeOp(std::move(out), loc);
}

OpPtr Lowering::lowerComponent(const node::Element& el, const std::string& unit,
                               const SourceLocation& loc) {
    op::Component out;
    out.name = el.tag;
    out.unit = unit;
    for (const auto& attr : el.attributes) {
        out.static_props.push_back(staticAttr(attr));
    }
    for (const auto& dir : el.directives) {
        if (dir.kind == DirectiveKind::Bind) {
            out.bound_props.push_back(op::BoundAttr{dir.arg, dir.expr.id});
        } else {
            out.events.push_back(op::Event{dir.arg, dir.expr.text});
        }
    }

    // Children are grouped by the slot they fill. <template slot="x">
    // contributes its children, any other element itself.
    std::map<std::string, std::vector<const TemplateNode*>> groups;
    for (const auto& child : el.children) {
        std::string target = slotTargetOf(*child);
        auto* wrapper = std::get_if<node::Element>(&child->kind);
        if (!target.empty() && wrapper && wrapper->tag == "template") {
            for (const auto& grandchild : wrapper->children) {
                groups[target].push_back(grandchild.get());
            }
            continue;
        }
        groups[target].push_back(child.get());
    }
    for (const auto& [slot, nodes] : groups) {
        out.slots[slot] = lowerNodes(nodes, !slot.empty());
    }
    return makeOp(std::move(out), loc);
}

OpPtr Lowering::lowerBranch(const node::Conditional& cond, const SourceLocation& loc, bool slotContent) {
    op::Branch branch;
    const node::Conditional* arm = &cond;
    while (arm) {
        OpList body;
        body.push_back(lowerNode(*arm->then_branch, slotContent));
        branch.arms.emplace_back(arm->cond.id, std::move(body));

        const TemplateNode* next = arm->else_branch.get();
        arm = nullptr;
        if (!next) break;
        if (auto* elseIf = std::get_if<node::Conditional>(&next->kind)) {
            arm = elseIf;
        } else {
            OpList otherwise;
            otherwise.push_back(lowerNode(*next, slotContent));
            branch.otherwise = std::move(otherwise);
        }
    }
    return makeOp(std::move(branch), loc);
}

RenderProgram RenderProgram::lower(const Template* markup, SemanticModel model, LogicSection logic) {
    RenderProgram program;
    program.interface_ = std::move(model.interface);
    program.exprs_ = std::move(model.exprs);
    program.components_ = std::move(model.components);

    for (auto& decl : logic.decls) {
        if (auto* prop = std::get_if<decl::Prop>(&decl.kind)) {
            PropSlot slot{prop->name, prop->type, nullptr};
            if (prop->default_value) slot.default_value = std::move(*prop->default_value);
            program.props_.push_back(std::move(slot));
        } else if (auto* state = std::get_if<decl::State>(&decl.kind)) {
            StateSlot slot{state->name, state->type, nullptr};
            if (state->initial) slot.initial = std::move(*state->initial);
            program.state_.push_back(std::move(slot));
        }
    }

    if (markup) {
        Lowering lowering(program);
        program.ops_ = lowering.lowerNodes(markup->roots, false);
    }
    return program;
}

const Expr& RenderProgram::expr(uint32_t id) const {
    if (id >= exprs_.size() || !exprs_[id]) {
        throw RenderError("render program has no expression #" + std::to_string(id));
    }
    return *exprs_[id];
}

// ─── Interpretation ─────────────────────────────────────────────────

namespace {

struct Frame {
    const Frame* parent = nullptr;
    std::map<std::string, Value> vars;

    const Value* find(const std::string& name) const {
        auto it = vars.find(name);
        if (it != vars.end()) return &it->second;
        return parent ? parent->find(name) : nullptr;
    }
};

class Interpreter {
public:
    Interpreter(const RenderProgram& program, const RenderInput& input)
        : program_(program), input_(input) {}

    void run(const OpList& ops, const Frame& frame, std::vector<RenderNode>& out);
    Value eval(const Expr& e, const Frame& frame);

private:
    void runOp(const RenderOp& op, const Frame& frame, std::vector<RenderNode>& out);
    Value binary(TokenKind op, const Expr& left, const Expr& right, const Frame& frame);

    const RenderProgram& program_;
    const RenderInput& input_;
};

void Interpreter::run(const OpList& ops, const Frame& frame, std::vector<RenderNode>& out) {
    for (const auto& op : ops) {
        runOp(*op, frame, out);
    }
}

void Interpreter::runOp(const RenderOp& op, const Frame& frame, std::vector<RenderNode>& out) {
    std::visit([this, &frame, &out](const auto& o) {
        using T = std::decay_t<decltype(o)>;

        if constexpr (std::is_same_v<T, op::Element>) {
            RenderNode node = RenderNode::element(o.tag);
            for (const auto& attr : o.static_attrs) {
                node.attributes.emplace_back(attr.name, attr.value);
            }
            for (const auto& attr : o.bound_attrs) {
                node.attributes.emplace_back(attr.name, eval(program_.expr(attr.expr), frame));
            }
            node.attributes.emplace_back(kScopeAttribute, Value(program_.scopeToken()));
            for (const auto& event : o.events) {
                node.events.emplace_back(event.name, event.method);
            }
            run(o.children, frame, node.children);
            out.push_back(std::move(node));
        } else if constexpr (std::is_same_v<T, op::Text>) {
            std::string text;
            for (const auto& part : o.parts) {
                text += part.is_expr ? eval(program_.expr(part.expr), frame).display() : part.literal;
            }
            out.push_back(RenderNode::textNode(std::move(text)));
        } else if constexpr (std::is_same_v<T, op::Component>) {
            RenderNode node = RenderNode::component(o.name, o.unit);
            for (const auto& prop : o.static_props) {
                node.props[prop.name] = prop.value;
            }
            for (const auto& prop : o.bound_props) {
                node.props[prop.name] = eval(program_.expr(prop.expr), frame);
            }
            for (const auto& event : o.events) {
                node.events.emplace_back(event.name, event.method);
            }
            for (const auto& [slot, ops] : o.slots) {
                run(ops, frame, node.slots[slot]);
            }
            out.push_back(std::move(node));
        } else if constexpr (std::is_same_v<T, op::Branch>) {
            for (const auto& [cond, body] : o.arms) {
                if (eval(program_.expr(cond), frame).truthy()) {
                    run(body, frame, out);
                    return;
                }
            }
            if (o.otherwise) {
                run(*o.otherwise, frame, out);
            } else {
                out.push_back(RenderNode::empty());
            }
        } else if constexpr (std::is_same_v<T, op::Each>) {
            Value iterable = eval(program_.expr(o.iterable), frame);
            for (const auto& [position, item] : iterate(iterable)) {
                Frame inner;
                inner.parent = &frame;
                inner.vars[o.binding] = item;
                if (o.index) inner.vars[*o.index] = position;

                size_t mark = out.size();
                run(o.body, inner, out);
                if (o.key) applyKey(out, mark, eval(program_.expr(*o.key), inner));
            }
        } else if constexpr (std::is_same_v<T, op::SlotOutlet>) {
            if (const auto* supplied = findSlot(input_, o.name)) {
                out.insert(out.end(), supplied->begin(), supplied->end());
            } else {
                run(o.fallback, frame, out);
            }
        }
    }, op.kind);
}

Value Interpreter::binary(TokenKind op, const Expr& left, const Expr& right, const Frame& frame) {
    if (op == TokenKind::AmpAmp) {
        return Value(eval(left, frame).truthy() && eval(right, frame).truthy());
    }
    if (op == TokenKind::PipePipe) {
        return Value(eval(left, frame).truthy() || eval(right, frame).truthy());
    }

    Value a = eval(left, frame);
    Value b = eval(right, frame);
    switch (op) {
        case TokenKind::Plus:         return add(a, b);
        case TokenKind::Minus:        return sub(a, b);
        case TokenKind::Star:         return mul(a, b);
        case TokenKind::Slash:        return div(a, b);
        case TokenKind::Percent:      return mod(a, b);
        case TokenKind::Equal:        return equal(a, b);
        case TokenKind::NotEqual:     return notEqual(a, b);
        case TokenKind::Less:         return less(a, b);
        case TokenKind::Greater:      return greater(a, b);
        case TokenKind::LessEqual:    return lessEqual(a, b);
        case TokenKind::GreaterEqual: return greaterEqual(a, b);
        default:
            throw RenderError(std::string("unsupported operator '") + tokenKindName(op) + "'");
    }
}

Value Interpreter::eval(const Expr& e, const Frame& frame) {
    return std::visit([this, &frame](const auto& x) -> Value {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, expr::Ident>) {
            const Value* value = frame.find(x.name);
            if (!value) throw RenderError("'" + x.name + "' is not defined");
            return *value;
        } else if constexpr (std::is_same_v<T, expr::StringLit>) {
            return Value(x.value);
        } else if constexpr (std::is_same_v<T, expr::IntLit>) {
            try {
                return Value(static_cast<int64_t>(std::stoll(x.value)));
            } catch (const std::out_of_range&) {
                throw RenderError("integer literal " + x.value + " is out of range");
            }
        } else if constexpr (std::is_same_v<T, expr::FloatLit>) {
            try {
                return Value(std::stod(x.value));
            } catch (const std::out_of_range&) {
                throw RenderError("float literal " + x.value + " is out of range");
            }
        } else if constexpr (std::is_same_v<T, expr::BoolLit>) {
            return Value(x.value);
        } else if constexpr (std::is_same_v<T, expr::NullLit>) {
            return Value();
        } else if constexpr (std::is_same_v<T, expr::ListLit>) {
            Value::List list;
            for (const auto& el : x.elements) list.push_back(eval(*el, frame));
            return Value(std::move(list));
        } else if constexpr (std::is_same_v<T, expr::MapLit>) {
            Value::Map map;
            for (const auto& entry : x.entries) map[entry.key] = eval(*entry.value, frame);
            return Value(std::move(map));
        } else if constexpr (std::is_same_v<T, expr::Member>) {
            return member(eval(*x.object, frame), x.member);
        } else if constexpr (std::is_same_v<T, expr::Index>) {
            return index(eval(*x.object, frame), eval(*x.index, frame));
        } else if constexpr (std::is_same_v<T, expr::Unary>) {
            Value operand = eval(*x.operand, frame);
            return x.op == TokenKind::Bang ? logicalNot(operand) : negate(operand);
        } else if constexpr (std::is_same_v<T, expr::Binary>) {
            return binary(x.op, *x.left, *x.right, frame);
        } else if constexpr (std::is_same_v<T, expr::Ternary>) {
            return eval(*x.cond, frame).truthy() ? eval(*x.then_value, frame)
                                                 : eval(*x.else_value, frame);
        } else {
            std::vector<Value> args;
            for (const auto& arg : x.args) args.push_back(eval(*arg, frame));
            return applyFilter(x.name, eval(*x.input, frame), args);
        }
    }, e.kind);
}

} // namespace

std::vector<RenderNode> RenderProgram::render(const RenderInput& input) const {
    Interpreter interp(*this, input);
    Frame root;

    // Defaults are literals, so they evaluate in an empty frame.
    Frame empty;
    for (const auto& prop : props_) {
        if (prop.default_value) {
            root.vars[prop.name] = propOr(input, prop.name, interp.eval(*prop.default_value, empty));
        } else {
            root.vars[prop.name] = requireProp(input, prop.name);
        }
    }
    for (const auto& state : state_) {
        Value initial = state.initial ? interp.eval(*state.initial, empty) : Value();
        root.vars[state.name] = stateOr(input, state.name, initial);
    }

    std::vector<RenderNode> out;
    interp.run(ops_, root, out);
    return out;
}

} // namespace prism
