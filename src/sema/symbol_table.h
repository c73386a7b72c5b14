#pragma once

#include "common/source_location.h"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace prism {

enum class SymbolKind {
    Prop,
    State,
    Method,
    Component,
    Filter,
    LoopVar,
};

const char* symbolKindName(SymbolKind kind);

struct Symbol {
    std::string name;
    SymbolKind kind;
    SourceLocation loc;
    std::string type_name;  // value type; unit identity for components
};

class Scope {
public:
    explicit Scope(Scope* parent = nullptr) : parent_(parent) {}

    bool define(const std::string& name, Symbol symbol);
    Symbol* lookup(const std::string& name);
    Symbol* lookupLocal(const std::string& name);

    // Innermost symbol named `name` that also has the given kind.
    Symbol* lookupKind(const std::string& name, SymbolKind kind);

    Scope* parent() const { return parent_; }

private:
    Scope* parent_;
    std::unordered_map<std::string, Symbol> symbols_;
};

class SymbolTable {
public:
    SymbolTable();

    void enterScope();
    void exitScope();

    bool define(const std::string& name, Symbol symbol);
    Symbol* lookup(const std::string& name);
    Symbol* lookupLocal(const std::string& name);
    Symbol* lookupKind(const std::string& name, SymbolKind kind);

    Scope* currentScope() const { return current_; }

private:
    std::vector<std::unique_ptr<Scope>> scopes_;
    Scope* current_ = nullptr;
};

} // namespace prism
