#include "style/css_emitter.h"

namespace prism {

std::string CssEmitter::emit(const Stylesheet& sheet) {
    out_.str("");
    out_.clear();

    for (size_t i = 0; i < sheet.rules.size(); ++i) {
        if (i > 0) out_ << "\n";
        emitRule(sheet.rules[i], 0);
    }
    return out_.str();
}

void CssEmitter::indent(int depth) {
    for (int i = 0; i < depth; ++i) out_ << "  ";
}

void CssEmitter::emitRule(const StyleRule& rule, int depth) {
    indent(depth);

    if (rule.kind == StyleRuleKind::Statement) {
        out_ << rule.emitted_selector << ";\n";
        return;
    }

    out_ << rule.emitted_selector << " {\n";
    for (const auto& decl : rule.declarations) {
        indent(depth + 1);
        out_ << decl.property << ": " << decl.value << ";\n";
    }
    for (const auto& child : rule.children) {
        emitRule(child, depth + 1);
    }
    indent(depth);
    out_ << "}\n";
}

} // namespace prism
