#pragma once

#include "common/source_location.h"

#include <string>
#include <vector>

namespace prism {

struct StyleDeclaration {
    std::string property;
    std::string value;
    SourceLocation loc;
};

enum class StyleRuleKind {
    Style,          // selector group { declarations }
    Conditional,    // @media / @supports: nested rules, scoping recurses
    Verbatim,       // @keyframes, @font-face and other block at-rules, never scoped
    Statement,      // @import url(...);  @charset "utf-8";
};

struct StyleRule {
    StyleRuleKind kind = StyleRuleKind::Style;
    std::string selector;           // as written; for at-rules "@media screen"
    std::string emitted_selector;   // after scoping; identical to `selector` when unscoped
    std::vector<StyleDeclaration> declarations;
    std::vector<StyleRule> children;
    bool scoped = false;
    SourceLocation loc;
};

struct Stylesheet {
    std::vector<StyleRule> rules;
};

} // namespace prism
