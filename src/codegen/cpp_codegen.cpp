#include "codegen/cpp_codegen.h"
#include "style/selector_scoper.h"

#include <cctype>
#include <unordered_set>
#include <variant>

namespace prism {

static std::string cppString(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char* digits = "01234567";
                    unsigned char u = static_cast<unsigned char>(c);
                    out += '\\';
                    out += digits[(u >> 6) & 7];
                    out += digits[(u >> 3) & 7];
                    out += digits[u & 7];
                } else {
                    out += c;
                }
        }
    }
    return out + "\"";
}

static std::string valueLiteral(const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Bool: return v.asBool() ? "prism::Value(true)" : "prism::Value(false)";
        case Value::Kind::String: return "prism::Value(std::string(" + cppString(v.asString()) + "))";
        default: return "prism::Value()";
    }
}

static std::string var(const std::string& name) {
    return "v_" + name;
}

std::string CppCodegen::namespaceFor(const std::string& unit) {
    static const std::unordered_set<std::string> keywords = {
        "alignas", "alignof", "and", "asm", "auto", "bool", "break", "case", "catch", "char",
        "class", "const", "continue", "default", "delete", "do", "double", "else", "enum",
        "explicit", "export", "extern", "false", "float", "for", "friend", "goto", "if",
        "inline", "int", "long", "namespace", "new", "not", "operator", "or", "private",
        "protected", "public", "register", "return", "short", "signed", "sizeof", "static",
        "struct", "switch", "template", "this", "throw", "true", "try", "typedef", "typename",
        "union", "unsigned", "using", "virtual", "void", "volatile", "while", "xor",
    };

    std::string result = "prism_gen";
    size_t start = 0;
    while (start <= unit.size()) {
        size_t slash = unit.find('/', start);
        std::string segment = unit.substr(start, slash == std::string::npos ? std::string::npos
                                                                            : slash - start);
        std::string ident;
        for (char c : segment) {
            ident += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
        }
        if (ident.empty() || std::isdigit(static_cast<unsigned char>(ident[0]))) ident = "_" + ident;
        if (keywords.count(ident)) ident += "_";
        result += "::" + ident;

        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return result;
}

std::string CppCodegen::fileName(const std::string& unit) const {
    return unit + ".render.hpp";
}

void CppCodegen::indent() { ++indentLevel_; }
void CppCodegen::dedent() { if (indentLevel_ > 0) --indentLevel_; }
void CppCodegen::writeIndent() { for (int i = 0; i < indentLevel_; ++i) out_ << "    "; }
void CppCodegen::writeln(const std::string& s) { writeIndent(); out_ << s << "\n"; }

std::string CppCodegen::fresh(const char* prefix) {
    return prefix + std::to_string(counter_++);
}

// ─── Header ─────────────────────────────────────────────────────────

std::string CppCodegen::generate(const RenderProgram& program) {
    out_.str("");
    out_.clear();
    indentLevel_ = 0;
    counter_ = 0;
    program_ = &program;

    std::string ns = namespaceFor(program.unit());

    writeln("// Generated by prism from " + program.unit() + ".prism. Do not edit.");
    for (const auto& prop : program.interface().props) {
        writeln("//   prop " + prop.name + ": " + prop.type +
                (prop.required ? " (required)" : " = " + prop.default_value));
    }
    for (const auto& slot : program.interface().slots) {
        writeln("//   slot " + (slot.empty() ? std::string("(default)") : slot));
    }
    writeln("#pragma once");
    writeln("");
    writeln("#include \"runtime/runtime.h\"");
    writeln("");
    writeln("#include <cstdint>");
    writeln("#include <string>");
    writeln("#include <vector>");
    writeln("");
    writeln("namespace " + ns + " {");
    writeln("");
    writeln("inline constexpr const char* kUnit = " + cppString(program.unit()) + ";");
    writeln("inline constexpr const char* kScopeToken = " + cppString(program.scopeToken()) + ";");
    writeln("");
    writeln("inline std::vector<prism::RenderNode> render(const prism::RenderInput& input) {");
    indent();
    emitPreamble(program);
    writeln("std::vector<prism::RenderNode> out;");
    emitOps(program.ops(), "out");
    writeln("return out;");
    dedent();
    writeln("}");
    writeln("");
    writeln("} // namespace " + ns);

    program_ = nullptr;
    return out_.str();
}

void CppCodegen::emitPreamble(const RenderProgram& program) {
    for (const auto& prop : program.props()) {
        std::string init = prop.default_value
            ? "prism::propOr(input, " + cppString(prop.name) + ", " + emitExpr(*prop.default_value) + ")"
            : "prism::requireProp(input, " + cppString(prop.name) + ")";
        writeln("[[maybe_unused]] const prism::Value " + var(prop.name) + " = " + init + ";");
    }
    for (const auto& state : program.state()) {
        std::string initial = state.initial ? emitExpr(*state.initial) : "prism::Value()";
        writeln("[[maybe_unused]] const prism::Value " + var(state.name) + " = prism::stateOr(input, " +
                cppString(state.name) + ", " + initial + ");");
    }
}

// ─── Operations ─────────────────────────────────────────────────────

void CppCodegen::emitOps(const OpList& ops, const std::string& out) {
    for (const auto& op : ops) {
        emitOp(*op, out);
    }
}

void CppCodegen::emitOp(const RenderOp& op, const std::string& out) {
    std::visit([this, &out](const auto& o) {
        using T = std::decay_t<decltype(o)>;

        if constexpr (std::is_same_v<T, op::Element>) {
            std::string n = fresh("n");
            writeln("{");
            indent();
            writeln("prism::RenderNode " + n + " = prism::RenderNode::element(" + cppString(o.tag) + ");");
            for (const auto& attr : o.static_attrs) {
                writeln(n + ".attributes.emplace_back(" + cppString(attr.name) + ", " +
                        valueLiteral(attr.value) + ");");
            }
            for (const auto& attr : o.bound_attrs) {
                writeln(n + ".attributes.emplace_back(" + cppString(attr.name) + ", " +
                        emitExpr(program_->expr(attr.expr)) + ");");
            }
            writeln(n + ".attributes.emplace_back(" + cppString(kScopeAttribute) +
                    ", prism::Value(std::string(kScopeToken)));");
            for (const auto& event : o.events) {
                writeln(n + ".events.emplace_back(" + cppString(event.name) + ", " +
                        cppString(event.method) + ");");
            }
            emitOps(o.children, n + ".children");
            writeln(out + ".push_back(std::move(" + n + "));");
            dedent();
            writeln("}");
        } else if constexpr (std::is_same_v<T, op::Text>) {
            std::string t = fresh("t");
            writeln("{");
            indent();
            writeln("std::string " + t + ";");
            for (const auto& part : o.parts) {
                if (part.is_expr) {
                    writeln(t + " += (" + emitExpr(program_->expr(part.expr)) + ").display();");
                } else {
                    writeln(t + " += " + cppString(part.literal) + ";");
                }
            }
            writeln(out + ".push_back(prism::RenderNode::textNode(std::move(" + t + ")));");
            dedent();
            writeln("}");
        } else if constexpr (std::is_same_v<T, op::Component>) {
            std::string n = fresh("n");
            writeln("{");
            indent();
            writeln("prism::RenderNode " + n + " = prism::RenderNode::component(" + cppString(o.name) +
                    ", " + cppString(o.unit) + ");");
            for (const auto& prop : o.static_props) {
                writeln(n + ".props[" + cppString(prop.name) + "] = " + valueLiteral(prop.value) + ";");
            }
            for (const auto& prop : o.bound_props) {
                writeln(n + ".props[" + cppString(prop.name) + "] = " +
                        emitExpr(program_->expr(prop.expr)) + ";");
            }
            for (const auto& event : o.events) {
                writeln(n + ".events.emplace_back(" + cppString(event.name) + ", " +
                        cppString(event.method) + ");");
            }
            for (const auto& [slot, ops] : o.slots) {
                std::string s = fresh("s");
                writeln("{");
                indent();
                writeln("std::vector<prism::RenderNode>& " + s + " = " + n + ".slots[" +
                        cppString(slot) + "];");
                emitOps(ops, s);
                dedent();
                writeln("}");
            }
            writeln(out + ".push_back(std::move(" + n + "));");
            dedent();
            writeln("}");
        } else if constexpr (std::is_same_v<T, op::Branch>) {
            for (size_t i = 0; i < o.arms.size(); ++i) {
                std::string cond = "prism::truthy(" + emitExpr(program_->expr(o.arms[i].first)) + ")";
                if (i == 0) {
                    writeln("if (" + cond + ") {");
                } else {
                    writeln("} else if (" + cond + ") {");
                }
                indent();
                emitOps(o.arms[i].second, out);
                dedent();
            }
            writeln("} else {");
            indent();
            if (o.otherwise) {
                emitOps(*o.otherwise, out);
            } else {
                writeln(out + ".push_back(prism::RenderNode::empty());");
            }
            dedent();
            writeln("}");
        } else if constexpr (std::is_same_v<T, op::Each>) {
            std::string item = fresh("it");
            writeln("for (const auto& " + item + " : prism::iterate(" +
                    emitExpr(program_->expr(o.iterable)) + ")) {");
            indent();
            writeln("[[maybe_unused]] const prism::Value& " + var(o.binding) + " = " + item + ".second;");
            if (o.index) {
                writeln("[[maybe_unused]] const prism::Value& " + var(*o.index) + " = " + item + ".first;");
            }
            std::string mark;
            if (o.key) {
                mark = fresh("mark");
                writeln("const size_t " + mark + " = " + out + ".size();");
            }
            emitOps(o.body, out);
            if (o.key) {
                writeln("prism::applyKey(" + out + ", " + mark + ", " +
                        emitExpr(program_->expr(*o.key)) + ");");
            }
            dedent();
            writeln("}");
        } else if constexpr (std::is_same_v<T, op::SlotOutlet>) {
            std::string s = fresh("s");
            writeln("if (const auto* " + s + " = prism::findSlot(input, " + cppString(o.name) + ")) {");
            indent();
            writeln(out + ".insert(" + out + ".end(), " + s + "->begin(), " + s + "->end());");
            dedent();
            writeln("} else {");
            indent();
            emitOps(o.fallback, out);
            dedent();
            writeln("}");
        }
    }, op.kind);
}

// ─── Expressions ────────────────────────────────────────────────────

static const char* binaryHelper(TokenKind op) {
    switch (op) {
        case TokenKind::Plus:         return "prism::add";
        case TokenKind::Minus:        return "prism::sub";
        case TokenKind::Star:         return "prism::mul";
        case TokenKind::Slash:        return "prism::div";
        case TokenKind::Percent:      return "prism::mod";
        case TokenKind::Equal:        return "prism::equal";
        case TokenKind::NotEqual:     return "prism::notEqual";
        case TokenKind::Less:         return "prism::less";
        case TokenKind::Greater:      return "prism::greater";
        case TokenKind::LessEqual:    return "prism::lessEqual";
        case TokenKind::GreaterEqual: return "prism::greaterEqual";
        default:                      return nullptr;
    }
}

std::string CppCodegen::emitExpr(const Expr& e) {
    return std::visit([this](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, expr::Ident>) {
            return var(x.name);
        } else if constexpr (std::is_same_v<T, expr::StringLit>) {
            return "prism::Value(std::string(" + cppString(x.value) + "))";
        } else if constexpr (std::is_same_v<T, expr::IntLit>) {
            return "prism::Value(static_cast<int64_t>(" + x.value + "LL))";
        } else if constexpr (std::is_same_v<T, expr::FloatLit>) {
            return "prism::Value(" + x.value + ")";
        } else if constexpr (std::is_same_v<T, expr::BoolLit>) {
            return x.value ? "prism::Value(true)" : "prism::Value(false)";
        } else if constexpr (std::is_same_v<T, expr::NullLit>) {
            return "prism::Value()";
        } else if constexpr (std::is_same_v<T, expr::ListLit>) {
            std::string s = "prism::Value(prism::Value::List{";
            for (size_t i = 0; i < x.elements.size(); ++i) {
                if (i > 0) s += ", ";
                s += emitExpr(*x.elements[i]);
            }
            return s + "})";
        } else if constexpr (std::is_same_v<T, expr::MapLit>) {
            std::string s = "prism::Value(prism::Value::Map{";
            for (size_t i = 0; i < x.entries.size(); ++i) {
                if (i > 0) s += ", ";
                s += "{" + cppString(x.entries[i].key) + ", " + emitExpr(*x.entries[i].value) + "}";
            }
            return s + "})";
        } else if constexpr (std::is_same_v<T, expr::Member>) {
            return "prism::member(" + emitExpr(*x.object) + ", " + cppString(x.member) + ")";
        } else if constexpr (std::is_same_v<T, expr::Index>) {
            return "prism::index(" + emitExpr(*x.object) + ", " + emitExpr(*x.index) + ")";
        } else if constexpr (std::is_same_v<T, expr::Unary>) {
            const char* helper = x.op == TokenKind::Bang ? "prism::logicalNot" : "prism::negate";
            return std::string(helper) + "(" + emitExpr(*x.operand) + ")";
        } else if constexpr (std::is_same_v<T, expr::Binary>) {
            if (x.op == TokenKind::AmpAmp || x.op == TokenKind::PipePipe) {
                const char* op = x.op == TokenKind::AmpAmp ? " && " : " || ";
                return "prism::Value(prism::truthy(" + emitExpr(*x.left) + ")" + op +
                       "prism::truthy(" + emitExpr(*x.right) + "))";
            }
            const char* helper = binaryHelper(x.op);
            if (!helper) {
                throw RenderError(std::string("unsupported operator '") + tokenKindName(x.op) + "'");
            }
            return std::string(helper) + "(" + emitExpr(*x.left) + ", " + emitExpr(*x.right) + ")";
        } else if constexpr (std::is_same_v<T, expr::Ternary>) {
            return "(prism::truthy(" + emitExpr(*x.cond) + ") ? " + emitExpr(*x.then_value) +
                   " : " + emitExpr(*x.else_value) + ")";
        } else {
            std::string s = "prism::applyFilter(" + cppString(x.name) + ", " + emitExpr(*x.input) + ", {";
            for (size_t i = 0; i < x.args.size(); ++i) {
                if (i > 0) s += ", ";
                s += emitExpr(*x.args[i]);
            }
            return s + "})";
        }
    }, e.kind);
}

} // namespace prism
