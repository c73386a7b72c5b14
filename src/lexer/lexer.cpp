#include "lexer/lexer.h"
#include "lexer/logic_lexer.h"
#include "lexer/markup_lexer.h"
#include "lexer/style_lexer.h"

namespace prism {

Lexer::Lexer(const std::string& source, const std::string& unit, DiagnosticEngine& diag)
    : source_(source), unit_(unit), diag_(diag) {}

UnitTokens Lexer::tokenize() {
    SectionScanner scanner(source_, unit_, diag_);
    auto sections = scanner.scan();

    UnitTokens out;
    const Section& markup = sections[static_cast<size_t>(SectionKind::Markup)];
    const Section& style = sections[static_cast<size_t>(SectionKind::Style)];
    const Section& logic = sections[static_cast<size_t>(SectionKind::Logic)];

    out.hasMarkup = markup.present;
    out.hasStyle = style.present;
    out.hasLogic = logic.present;
    out.globalStyle = style.hasAttribute("global");

    // Each section is tokenized on its own so that an error in one of them
    // never hides the diagnostics of the others.
    if (markup.present && markup.valid) {
        int before = diag_.errorCount();
        out.markup = MarkupLexer(markup.text, markup.start, diag_).tokenize();
        out.markupOk = diag_.errorCount() == before;
    } else {
        out.markupOk = !markup.present;
    }

    if (style.present && style.valid) {
        int before = diag_.errorCount();
        out.style = StyleLexer(style.text, style.start, diag_).tokenize();
        out.styleOk = diag_.errorCount() == before;
    } else {
        out.styleOk = !style.present;
    }

    if (logic.present && logic.valid) {
        int before = diag_.errorCount();
        out.logic = LogicLexer(logic.text, logic.start, diag_).tokenize();
        out.logicOk = diag_.errorCount() == before;
    } else {
        out.logicOk = !logic.present;
    }

    SourceLocation end{unit_, 1, 1, 0};
    if (out.markup.empty() || !out.markupOk) {
        out.markup = {MarkupToken{MarkupTokenKind::Eof, "", end}};
    }
    if (out.style.empty() || !out.styleOk) {
        out.style = {StyleToken{StyleTokenKind::Eof, "", end}};
    }
    if (out.logic.empty() || !out.logicOk) {
        out.logic = {Token{TokenKind::Eof, "", end}};
    }

    return out;
}

} // namespace prism
