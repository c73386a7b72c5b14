#pragma once

#include "style/style_ast.h"

#include <sstream>
#include <string>

namespace prism {

// Writes a scoped stylesheet as CSS text. Output depends only on the rule
// list, so identical input yields byte-identical files.
class CssEmitter {
public:
    std::string emit(const Stylesheet& sheet);

private:
    void emitRule(const StyleRule& rule, int depth);
    void indent(int depth);

    std::ostringstream out_;
};

} // namespace prism
