#pragma once

#include "codegen/codegen.h"

#include <sstream>
#include <string>

namespace prism {

// Emits `<unit>.render.hpp`: a self-contained header defining
// `prism_gen::<unit>::render(const prism::RenderInput&)`, built on the
// runtime helpers so it renders exactly what the RenderProgram renders.
class CppCodegen : public CodeGenerator {
public:
    std::string generate(const RenderProgram& program) override;
    std::string fileName(const std::string& unit) const override;

    // "components/card" -> "prism_gen::components::card"
    static std::string namespaceFor(const std::string& unit);

private:
    void emitPreamble(const RenderProgram& program);
    void emitOps(const OpList& ops, const std::string& out);
    void emitOp(const RenderOp& op, const std::string& out);
    std::string emitExpr(const Expr& e);

    std::string fresh(const char* prefix);

    void indent();
    void dedent();
    void writeIndent();
    void writeln(const std::string& s);

    std::ostringstream out_;
    const RenderProgram* program_ = nullptr;
    int indentLevel_ = 0;
    int counter_ = 0;
};

} // namespace prism
