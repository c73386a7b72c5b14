#pragma once

#include "codegen/render_program.h"

#include <string>

namespace prism {

class CodeGenerator {
public:
    virtual ~CodeGenerator() = default;
    virtual std::string generate(const RenderProgram& program) = 0;

    // Artifact file name for a unit, relative to the output directory.
    virtual std::string fileName(const std::string& unit) const = 0;
};

} // namespace prism
