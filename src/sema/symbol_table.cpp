#include "sema/symbol_table.h"

namespace prism {

const char* symbolKindName(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Prop:      return "prop";
        case SymbolKind::State:     return "state";
        case SymbolKind::Method:    return "method";
        case SymbolKind::Component: return "component";
        case SymbolKind::Filter:    return "filter";
        case SymbolKind::LoopVar:   return "loop variable";
    }
    return "symbol";
}

bool Scope::define(const std::string& name, Symbol symbol) {
    auto [it, inserted] = symbols_.emplace(name, std::move(symbol));
    return inserted;
}

Symbol* Scope::lookup(const std::string& name) {
    auto it = symbols_.find(name);
    if (it != symbols_.end()) return &it->second;
    if (parent_) return parent_->lookup(name);
    return nullptr;
}

Symbol* Scope::lookupLocal(const std::string& name) {
    auto it = symbols_.find(name);
    if (it != symbols_.end()) return &it->second;
    return nullptr;
}

Symbol* Scope::lookupKind(const std::string& name, SymbolKind kind) {
    auto it = symbols_.find(name);
    if (it != symbols_.end() && it->second.kind == kind) return &it->second;
    if (parent_) return parent_->lookupKind(name, kind);
    return nullptr;
}

SymbolTable::SymbolTable() {
    // Root scope holds the built-in filters.
    scopes_.push_back(std::make_unique<Scope>(nullptr));
    current_ = scopes_.back().get();
}

void SymbolTable::enterScope() {
    scopes_.push_back(std::make_unique<Scope>(current_));
    current_ = scopes_.back().get();
}

void SymbolTable::exitScope() {
    if (current_->parent()) {
        current_ = current_->parent();
    }
}

bool SymbolTable::define(const std::string& name, Symbol symbol) {
    return current_->define(name, std::move(symbol));
}

Symbol* SymbolTable::lookup(const std::string& name) {
    return current_->lookup(name);
}

Symbol* SymbolTable::lookupLocal(const std::string& name) {
    return current_->lookupLocal(name);
}

Symbol* SymbolTable::lookupKind(const std::string& name, SymbolKind kind) {
    return current_->lookupKind(name, kind);
}

} // namespace prism
