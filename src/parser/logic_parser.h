#pragma once

#include "common/diagnostics.h"
#include "lexer/token.h"
#include "parser/logic_ast.h"

#include <string>
#include <vector>

namespace prism {

class LogicParser {
public:
    LogicParser(std::vector<Token> tokens, const std::string& unit, DiagnosticEngine& diag);

    LogicSection parse();

    // Shallow pass used to seed the dependency graph before any unit is
    // compiled: returns the unit identities imported by `source`.
    // Malformed input yields whatever imports could be recognised.
    static std::vector<std::string> scanImports(const std::string& source, const std::string& unit);

private:
    const Token& peek() const;
    const Token& peekNext() const;
    const Token& advance();
    bool check(TokenKind kind) const;
    bool match(TokenKind kind);
    const Token& expect(TokenKind kind, const std::string& msg);
    void expectSemicolon();
    void synchronize();

    SourceLocation loc() const { return peek().loc; }

    Decl parseDecl();
    decl::Import parseImport();
    decl::Prop parseProp();
    decl::State parseState();
    decl::Method parseMethod();
    std::string parseTypeAnnotation();

    std::vector<Token> tokens_;
    std::string unit_;
    DiagnosticEngine& diag_;
    size_t pos_ = 0;

    struct SyntaxError {};
};

// Resolves an import path against the importing unit: "./x" and "../x" are
// relative to the importer's directory, anything else is relative to the
// source root. A trailing ".prism" is dropped.
std::string resolveImportPath(const std::string& importer, const std::string& path);

} // namespace prism
