#pragma once

#include "common/source_location.h"

#include <string>
#include <vector>
#include <iostream>

namespace prism {

enum class DiagLevel {
    Error,
    Warning,
    Note,
};

enum class DiagCode {
    None,
    MalformedSection,
    InvalidMarkup,
    UnclosedElement,
    UnknownDirective,
    InvalidSelector,
    InvalidDeclaration,
    InvalidExpression,
    UnresolvedSymbol,
    MissingRequiredProp,
    MissingLogicSection,
    DuplicateDeclaration,
    UnknownProp,
    UnknownSlot,
    DependencyFailed,
    CircularDependency,
    Io,
    Config,
};

const char* diagCodeName(DiagCode code);

struct Diagnostic {
    DiagLevel level;
    DiagCode code;
    SourceLocation loc;
    std::string message;

    const std::string& unit() const { return loc.file; }
};

class DiagnosticEngine {
public:
    void error(const SourceLocation& loc, const std::string& msg);
    void warning(const SourceLocation& loc, const std::string& msg);
    void note(const SourceLocation& loc, const std::string& msg);

    void error(DiagCode code, const SourceLocation& loc, const std::string& msg);
    void warning(DiagCode code, const SourceLocation& loc, const std::string& msg);

    void emit(DiagLevel level, DiagCode code, const SourceLocation& loc, const std::string& msg);
    void print(const Diagnostic& diag) const;
    void printAll() const;

    // Append every diagnostic of `other`, without re-printing them.
    void merge(const DiagnosticEngine& other);

    // When echo is off, diagnostics are only recorded.
    void setEcho(bool enabled) { echo_ = enabled; }

    bool hasErrors() const { return error_count_ > 0; }
    int errorCount() const { return error_count_; }
    int warningCount() const { return warning_count_; }
    size_t count(DiagCode code) const;
    bool has(DiagCode code) const { return count(code) > 0; }
    const std::vector<Diagnostic>& diagnostics() const { return diags_; }

private:
    std::vector<Diagnostic> diags_;
    int error_count_ = 0;
    int warning_count_ = 0;
    bool echo_ = true;
};

} // namespace prism
