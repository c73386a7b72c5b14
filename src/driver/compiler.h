#pragma once

#include "codegen/render_program.h"
#include "common/diagnostics.h"
#include "sema/component_interface.h"
#include "style/style_ast.h"

#include <functional>
#include <optional>
#include <string>

namespace prism {

struct CompileOptions {
    bool strict = false;    // unknown directives are errors
};

// Called between pipeline stages with the name of the next stage
// ("parse", "analyze", "codegen"). Returning false abandons the unit.
using Checkpoint = std::function<bool(const std::string& stage)>;

struct CompileResult {
    bool cancelled = false;

    // Present whenever the style section parsed, even if another section
    // failed.
    std::optional<Stylesheet> stylesheet;
    std::string css;

    // Present only for a unit without errors.
    std::optional<RenderProgram> program;
    std::string header;

    bool ok() const { return program.has_value(); }
};

// Runs the whole pipeline for one unit. Pure apart from `diag`: the result
// depends only on the source text, the unit identity, the scope token and
// the dependency interfaces.
class Compiler {
public:
    Compiler(DiagnosticEngine& diag, CompileOptions options = {});

    CompileResult compile(const std::string& source, const std::string& unit,
                          const std::string& scopeToken, const DependencyMap& dependencies);

    void setCheckpoint(Checkpoint checkpoint) { checkpoint_ = std::move(checkpoint); }

private:
    bool proceed(const std::string& stage);

    DiagnosticEngine& diag_;
    CompileOptions options_;
    Checkpoint checkpoint_;
};

} // namespace prism
