#include "parser/logic_parser.h"
#include "lexer/logic_lexer.h"
#include "lexer/section_scanner.h"
#include "parser/expr_parser.h"

#include <filesystem>

namespace prism {

bool isKnownValueType(const std::string& type) {
    return type == "string" || type == "int" || type == "float" || type == "bool" ||
           type == "list" || type == "map" || type == "any";
}

std::string resolveImportPath(const std::string& importer, const std::string& path) {
    namespace fs = std::filesystem;

    std::string p = path;
    const std::string ext = ".prism";
    if (p.size() > ext.size() && p.compare(p.size() - ext.size(), ext.size(), ext) == 0) {
        p.erase(p.size() - ext.size());
    }

    fs::path resolved;
    if (p.rfind("./", 0) == 0 || p.rfind("../", 0) == 0) {
        resolved = fs::path(importer).parent_path() / p;
    } else {
        resolved = fs::path(p);
    }
    return resolved.lexically_normal().generic_string();
}

LogicParser::LogicParser(std::vector<Token> tokens, const std::string& unit, DiagnosticEngine& diag)
    : tokens_(std::move(tokens)), unit_(unit), diag_(diag) {}

// ─── Token stream ───────────────────────────────────────────────────

const Token& LogicParser::peek() const {
    return tokens_[pos_];
}

const Token& LogicParser::peekNext() const {
    if (pos_ + 1 < tokens_.size()) return tokens_[pos_ + 1];
    return tokens_.back();
}

const Token& LogicParser::advance() {
    const Token& tok = tokens_[pos_];
    if (pos_ < tokens_.size() - 1) ++pos_;
    return tok;
}

bool LogicParser::check(TokenKind kind) const {
    return peek().kind == kind;
}

bool LogicParser::match(TokenKind kind) {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

const Token& LogicParser::expect(TokenKind kind, const std::string& msg) {
    if (check(kind)) return advance();
    diag_.error(DiagCode::InvalidExpression, peek().loc, msg + ", got '" +
                (peek().is(TokenKind::Eof) ? std::string("end of section") : peek().text) + "'");
    throw SyntaxError{};
}

void LogicParser::expectSemicolon() {
    if (!match(TokenKind::Semicolon) && !check(TokenKind::Eof)) {
        diag_.error(DiagCode::InvalidExpression, peek().loc, "expected newline or ';' after declaration, got '" + peek().text + "'");
        throw SyntaxError{};
    }
}

void LogicParser::synchronize() {
    while (!check(TokenKind::Eof)) {
        if (match(TokenKind::Semicolon)) return;
        switch (peek().kind) {
            case TokenKind::Import:
            case TokenKind::Prop:
            case TokenKind::State:
            case TokenKind::Method:
                return;
            default:
                advance();
        }
    }
}

// ─── Declarations ───────────────────────────────────────────────────

LogicSection LogicParser::parse() {
    LogicSection section;

    while (!check(TokenKind::Eof)) {
        if (match(TokenKind::Semicolon)) continue;

        try {
            section.decls.push_back(parseDecl());
        } catch (const SyntaxError&) {
            synchronize();
        }
    }

    return section;
}

Decl LogicParser::parseDecl() {
    auto location = loc();

    if (check(TokenKind::Import)) return Decl{parseImport(), location};
    if (check(TokenKind::Prop))   return Decl{parseProp(), location};
    if (check(TokenKind::State))  return Decl{parseState(), location};
    if (check(TokenKind::Method)) return Decl{parseMethod(), location};

    diag_.error(DiagCode::InvalidExpression, peek().loc, "expected 'import', 'prop', 'state' or 'method', got '" + peek().text + "'");
    throw SyntaxError{};
}

decl::Import LogicParser::parseImport() {
    expect(TokenKind::Import, "expected 'import'");
    auto name = expect(TokenKind::Ident, "expected component name").text;
    expect(TokenKind::From, "expected 'from'");
    auto path = expect(TokenKind::StringLit, "expected unit path string").text;
    expectSemicolon();
    return decl::Import{name, path, resolveImportPath(unit_, path)};
}

std::string LogicParser::parseTypeAnnotation() {
    if (!match(TokenKind::Colon)) return "any";
    return expect(TokenKind::Ident, "expected type name").text;
}

decl::Prop LogicParser::parseProp() {
    expect(TokenKind::Prop, "expected 'prop'");
    decl::Prop prop;
    prop.name = expect(TokenKind::Ident, "expected prop name").text;
    prop.type = parseTypeAnnotation();

    if (match(TokenKind::Assign)) {
        int before = diag_.errorCount();
        ExprParser exprParser(tokens_, pos_, diag_);
        auto value = exprParser.parseTernary();
        if (diag_.errorCount() != before) throw SyntaxError{};
        prop.default_value = std::move(value);
    }
    expectSemicolon();
    return prop;
}

decl::State LogicParser::parseState() {
    expect(TokenKind::State, "expected 'state'");
    decl::State state;
    state.name = expect(TokenKind::Ident, "expected state name").text;
    state.type = parseTypeAnnotation();

    if (match(TokenKind::Assign)) {
        int before = diag_.errorCount();
        ExprParser exprParser(tokens_, pos_, diag_);
        auto value = exprParser.parseTernary();
        if (diag_.errorCount() != before) throw SyntaxError{};
        state.initial = std::move(value);
    }
    expectSemicolon();
    return state;
}

decl::Method LogicParser::parseMethod() {
    expect(TokenKind::Method, "expected 'method'");
    auto name = expect(TokenKind::Ident, "expected method name").text;
    expectSemicolon();
    return decl::Method{name};
}

// ─── Shallow import scan ────────────────────────────────────────────

std::vector<std::string> LogicParser::scanImports(const std::string& source, const std::string& unit) {
    DiagnosticEngine scratch;
    scratch.setEcho(false);

    auto sections = SectionScanner(source, unit, scratch).scan();
    const Section& logic = sections[static_cast<size_t>(SectionKind::Logic)];
    if (!logic.present || logic.text.empty()) return {};

    auto tokens = LogicLexer(logic.text, logic.start, scratch).tokenize();

    std::vector<std::string> imports;
    for (size_t i = 0; i + 3 < tokens.size(); ++i) {
        if (tokens[i].is(TokenKind::Import) && tokens[i + 1].is(TokenKind::Ident) &&
            tokens[i + 2].is(TokenKind::From) && tokens[i + 3].is(TokenKind::StringLit)) {
            auto resolved = resolveImportPath(unit, tokens[i + 3].text);
            bool seen = false;
            for (const auto& existing : imports) {
                if (existing == resolved) seen = true;
            }
            if (!seen) imports.push_back(resolved);
        }
    }
    return imports;
}

} // namespace prism
