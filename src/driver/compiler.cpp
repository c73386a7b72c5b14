#include "driver/compiler.h"
#include "codegen/cpp_codegen.h"
#include "lexer/lexer.h"
#include "parser/logic_parser.h"
#include "parser/template_parser.h"
#include "sema/analyzer.h"
#include "style/css_emitter.h"
#include "style/style_parser.h"

namespace prism {

Compiler::Compiler(DiagnosticEngine& diag, CompileOptions options)
    : diag_(diag), options_(options) {}

bool Compiler::proceed(const std::string& stage) {
    return !checkpoint_ || checkpoint_(stage);
}

CompileResult Compiler::compile(const std::string& source, const std::string& unit,
                                const std::string& scopeToken, const DependencyMap& dependencies) {
    CompileResult result;
    int before = diag_.errorCount();

    // Lex
    Lexer lexer(source, unit, diag_);
    auto tokens = lexer.tokenize();

    if (!proceed("parse")) {
        result.cancelled = true;
        return result;
    }

    // Parse each section on its own; a failed section does not stop the others.
    std::optional<Template> markup;
    if (tokens.hasMarkup && tokens.markupOk) {
        TemplateParserOptions markupOptions;
        markupOptions.strict_directives = options_.strict;
        TemplateParser parser(std::move(tokens.markup), diag_, markupOptions);
        markup = parser.parse();
    }

    if (tokens.hasStyle && tokens.styleOk) {
        StyleParserOptions styleOptions;
        styleOptions.scope_token = scopeToken;
        styleOptions.global = tokens.globalStyle;
        StyleParser parser(std::move(tokens.style), diag_, styleOptions);
        result.stylesheet = parser.parse();
    } else if (!tokens.hasStyle) {
        result.stylesheet = Stylesheet{};
    }
    if (result.stylesheet) {
        CssEmitter emitter;
        result.css = emitter.emit(*result.stylesheet);
    }

    std::optional<LogicSection> logic;
    if (tokens.hasLogic && tokens.logicOk) {
        LogicParser parser(std::move(tokens.logic), unit, diag_);
        logic = parser.parse();
    }

    if (!proceed("analyze")) {
        result.cancelled = true;
        return result;
    }

    // A logic section that failed to tokenize has already been reported.
    if (tokens.hasLogic && !logic) return result;

    // Analyze. A failed markup section is analyzed as absent so logic
    // errors still surface.
    Analyzer analyzer(unit, diag_);
    auto model = analyzer.analyze(logic ? &*logic : nullptr, markup ? &*markup : nullptr,
                                  dependencies, scopeToken);
    if (!model || diag_.errorCount() != before) return result;

    if (!proceed("codegen")) {
        result.cancelled = true;
        return result;
    }

    // Codegen
    result.program = RenderProgram::lower(markup ? &*markup : nullptr, std::move(*model), std::move(*logic));
    CppCodegen codegen;
    result.header = codegen.generate(*result.program);
    return result;
}

} // namespace prism
