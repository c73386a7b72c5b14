#pragma once

#include "common/diagnostics.h"
#include "lexer/section_scanner.h"
#include "lexer/token.h"

#include <string>
#include <vector>

namespace prism {

// The three disjoint token streams of one source unit. A stream whose
// section failed to tokenize is marked not ok and holds only Eof.
struct UnitTokens {
    std::vector<MarkupToken> markup;
    std::vector<StyleToken> style;
    std::vector<Token> logic;

    bool hasMarkup = false;
    bool hasStyle = false;
    bool hasLogic = false;

    bool markupOk = true;
    bool styleOk = true;
    bool logicOk = true;

    bool globalStyle = false;  // <style global>
};

class Lexer {
public:
    Lexer(const std::string& source, const std::string& unit, DiagnosticEngine& diag);

    UnitTokens tokenize();

private:
    std::string source_;
    std::string unit_;
    DiagnosticEngine& diag_;
};

} // namespace prism
