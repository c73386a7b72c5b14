#pragma once

#include "common/diagnostics.h"
#include "parser/logic_ast.h"
#include "parser/template_ast.h"
#include "sema/component_interface.h"
#include "sema/symbol_table.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace prism {

// Everything later stages need from a semantically valid unit.
struct SemanticModel {
    ComponentInterface interface;
    std::vector<ExprPtr> exprs;                     // indexed by TemplateExpr::id
    std::map<std::string, std::string> components;  // local name -> unit identity
};

class Analyzer {
public:
    Analyzer(std::string unit, DiagnosticEngine& diag);

    // `logic` is null when the unit has no logic section, `markup` when the
    // markup section is absent. Returns nullopt if any semantic error was
    // reported.
    std::optional<SemanticModel> analyze(const LogicSection* logic, const Template* markup,
                                         const DependencyMap& dependencies,
                                         const std::string& scopeToken);

    SymbolTable& symbols() { return symbols_; }

private:
    void registerBuiltins();
    void registerDecl(const Decl& decl);
    void checkDefault(const Expr& value);
    void checkImport(const decl::Import& import, const SourceLocation& loc);

    void checkNodes(const std::vector<NodePtr>& nodes);
    void checkNode(const TemplateNode& node);
    void checkElement(const node::Element& el, const SourceLocation& loc);
    void checkComponentUsage(const node::Element& el, const ComponentInterface& iface,
                             const SourceLocation& loc);
    void checkHandler(const Directive& dir);

    void parseExpr(const TemplateExpr& te, const std::string& source);
    void resolveExpr(const Expr& e);

    std::string unit_;
    DiagnosticEngine& diag_;
    SymbolTable symbols_;
    const DependencyMap* dependencies_ = nullptr;
    SemanticModel model_;
};

} // namespace prism
