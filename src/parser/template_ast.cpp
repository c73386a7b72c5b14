#include "parser/template_ast.h"

#include <cctype>
#include <unordered_set>

namespace prism {

const Attribute* node::Element::findAttribute(const std::string& name) const {
    for (const auto& attr : attributes) {
        if (attr.name == name) return &attr;
    }
    return nullptr;
}

bool isVoidElement(const std::string& tag) {
    static const std::unordered_set<std::string> voids = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "link", "meta", "source", "track", "wbr",
    };
    return voids.count(tag) > 0;
}

bool isComponentTag(const std::string& tag) {
    return !tag.empty() && std::isupper(static_cast<unsigned char>(tag[0]));
}

std::string slotTargetOf(const TemplateNode& node) {
    if (auto* el = std::get_if<node::Element>(&node.kind)) {
        if (const Attribute* attr = el->findAttribute("slot")) return attr->value;
        return "";
    }
    if (auto* cond = std::get_if<node::Conditional>(&node.kind)) {
        return slotTargetOf(*cond->then_branch);
    }
    if (auto* loop = std::get_if<node::Loop>(&node.kind)) {
        return slotTargetOf(*loop->body);
    }
    return "";
}

static bool sameExpr(const TemplateExpr& a, const TemplateExpr& b) {
    return a.text == b.text;
}

static bool sameOptional(const NodePtr& a, const NodePtr& b) {
    if (!a || !b) return !a && !b;
    return structurallyEqual(*a, *b);
}

bool structurallyEqual(const std::vector<NodePtr>& a, const std::vector<NodePtr>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!structurallyEqual(*a[i], *b[i])) return false;
    }
    return true;
}

bool structurallyEqual(const TemplateNode& a, const TemplateNode& b) {
    if (a.kind.index() != b.kind.index()) return false;

    return std::visit([&b](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        const auto& y = std::get<T>(b.kind);

        if constexpr (std::is_same_v<T, node::Element>) {
            if (x.tag != y.tag) return false;
            if (x.attributes.size() != y.attributes.size()) return false;
            for (size_t i = 0; i < x.attributes.size(); ++i) {
                const auto& l = x.attributes[i];
                const auto& r = y.attributes[i];
                if (l.name != r.name || l.value != r.value || l.has_value != r.has_value) return false;
            }
            if (x.directives.size() != y.directives.size()) return false;
            for (size_t i = 0; i < x.directives.size(); ++i) {
                const auto& l = x.directives[i];
                const auto& r = y.directives[i];
                if (l.kind != r.kind || l.arg != r.arg || !sameExpr(l.expr, r.expr)) return false;
            }
            return structurallyEqual(x.children, y.children);
        } else if constexpr (std::is_same_v<T, node::Text>) {
            return x.value == y.value;
        } else if constexpr (std::is_same_v<T, node::Interpolation>) {
            return sameExpr(x.expr, y.expr) && x.filters == y.filters;
        } else if constexpr (std::is_same_v<T, node::Conditional>) {
            return sameExpr(x.cond, y.cond) && sameOptional(x.then_branch, y.then_branch) &&
                   sameOptional(x.else_branch, y.else_branch);
        } else if constexpr (std::is_same_v<T, node::Loop>) {
            if (x.binding != y.binding || x.index != y.index) return false;
            if (!sameExpr(x.iterable, y.iterable)) return false;
            if (x.key.has_value() != y.key.has_value()) return false;
            if (x.key && !sameExpr(*x.key, *y.key)) return false;
            return sameOptional(x.body, y.body);
        } else if constexpr (std::is_same_v<T, node::Slot>) {
            return x.name == y.name && structurallyEqual(x.fallback, y.fallback);
        }
    }, a.kind);
}

} // namespace prism
