#include "parser/template_printer.h"

namespace prism {

std::string TemplatePrinter::print(const std::vector<NodePtr>& roots) {
    out_.str("");
    out_.clear();
    printChildren(roots);
    return out_.str();
}

std::string TemplatePrinter::print(const TemplateNode& node) {
    out_.str("");
    out_.clear();
    printNode(node, "");
    return out_.str();
}

std::string TemplatePrinter::attr(const std::string& name, const std::string& value) {
    char quote = value.find('"') == std::string::npos ? '"' : '\'';
    return " " + name + "=" + quote + value + quote;
}

void TemplatePrinter::printChildren(const std::vector<NodePtr>& children) {
    for (const auto& child : children) {
        printNode(*child, "");
    }
}

void TemplatePrinter::printNode(const TemplateNode& node, const std::string& prefix) {
    std::visit([this, &prefix](const auto& n) {
        using T = std::decay_t<decltype(n)>;

        if constexpr (std::is_same_v<T, node::Element>) {
            printElement(n, prefix);
        } else if constexpr (std::is_same_v<T, node::Slot>) {
            printSlot(n, prefix);
        } else if constexpr (std::is_same_v<T, node::Text>) {
            out_ << n.value;
        } else if constexpr (std::is_same_v<T, node::Interpolation>) {
            out_ << "{{ " << n.expr.text;
            for (const auto& filter : n.filters) {
                out_ << " | " << filter;
            }
            out_ << " }}";
        } else if constexpr (std::is_same_v<T, node::Conditional>) {
            printNode(*n.then_branch, prefix + attr("p-if", n.cond.text));
            printElseChain(n.else_branch.get());
        } else if constexpr (std::is_same_v<T, node::Loop>) {
            std::string header = n.binding;
            if (n.index) header = "(" + n.binding + ", " + *n.index + ")";
            std::string directives = attr("p-for", header + " in " + n.iterable.text);
            if (n.key) directives += attr(":key", n.key->text);
            printNode(*n.body, prefix + directives);
        }
    }, node.kind);
}

void TemplatePrinter::printElseChain(const TemplateNode* branch) {
    while (branch) {
        if (auto* cond = std::get_if<node::Conditional>(&branch->kind)) {
            printNode(*cond->then_branch, attr("p-else-if", cond->cond.text));
            branch = cond->else_branch.get();
        } else {
            printNode(*branch, " p-else");
            branch = nullptr;
        }
    }
}

void TemplatePrinter::printElement(const node::Element& el, const std::string& prefix) {
    out_ << "<" << el.tag << prefix;
    for (const auto& a : el.attributes) {
        if (a.has_value) {
            out_ << attr(a.name, a.value);
        } else {
            out_ << " " << a.name;
        }
    }
    for (const auto& d : el.directives) {
        out_ << attr((d.kind == DirectiveKind::Bind ? ":" : "@") + d.arg, d.expr.text);
    }

    if (el.children.empty()) {
        out_ << (isVoidElement(el.tag) ? ">" : "/>");
        return;
    }
    out_ << ">";
    printChildren(el.children);
    out_ << "</" << el.tag << ">";
}

void TemplatePrinter::printSlot(const node::Slot& slot, const std::string& prefix) {
    out_ << "<slot" << prefix;
    if (!slot.name.empty()) out_ << attr("name", slot.name);
    if (slot.fallback.empty()) {
        out_ << "/>";
        return;
    }
    out_ << ">";
    printChildren(slot.fallback);
    out_ << "</slot>";
}

} // namespace prism
