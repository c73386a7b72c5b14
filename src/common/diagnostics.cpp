#include "common/diagnostics.h"

namespace prism {

const char* diagCodeName(DiagCode code) {
    switch (code) {
        case DiagCode::None:                return "";
        case DiagCode::MalformedSection:    return "malformed-section";
        case DiagCode::InvalidMarkup:       return "invalid-markup";
        case DiagCode::UnclosedElement:     return "unclosed-element";
        case DiagCode::UnknownDirective:    return "unknown-directive";
        case DiagCode::InvalidSelector:     return "invalid-selector";
        case DiagCode::InvalidDeclaration:  return "invalid-declaration";
        case DiagCode::InvalidExpression:   return "invalid-expression";
        case DiagCode::UnresolvedSymbol:    return "unresolved-symbol";
        case DiagCode::MissingRequiredProp: return "missing-required-prop";
        case DiagCode::MissingLogicSection: return "missing-logic-section";
        case DiagCode::DuplicateDeclaration:return "duplicate-declaration";
        case DiagCode::UnknownProp:         return "unknown-prop";
        case DiagCode::UnknownSlot:         return "unknown-slot";
        case DiagCode::DependencyFailed:    return "dependency-failed";
        case DiagCode::CircularDependency:  return "circular-dependency";
        case DiagCode::Io:                  return "io";
        case DiagCode::Config:              return "config";
    }
    return "";
}

void DiagnosticEngine::error(const SourceLocation& loc, const std::string& msg) {
    emit(DiagLevel::Error, DiagCode::None, loc, msg);
}

void DiagnosticEngine::warning(const SourceLocation& loc, const std::string& msg) {
    emit(DiagLevel::Warning, DiagCode::None, loc, msg);
}

void DiagnosticEngine::note(const SourceLocation& loc, const std::string& msg) {
    emit(DiagLevel::Note, DiagCode::None, loc, msg);
}

void DiagnosticEngine::error(DiagCode code, const SourceLocation& loc, const std::string& msg) {
    emit(DiagLevel::Error, code, loc, msg);
}

void DiagnosticEngine::warning(DiagCode code, const SourceLocation& loc, const std::string& msg) {
    emit(DiagLevel::Warning, code, loc, msg);
}

void DiagnosticEngine::emit(DiagLevel level, DiagCode code, const SourceLocation& loc,
                            const std::string& msg) {
    diags_.push_back({level, code, loc, msg});
    if (level == DiagLevel::Error) {
        ++error_count_;
    } else if (level == DiagLevel::Warning) {
        ++warning_count_;
    }
    if (echo_) {
        print(diags_.back());
    }
}

void DiagnosticEngine::merge(const DiagnosticEngine& other) {
    for (const auto& diag : other.diags_) {
        diags_.push_back(diag);
    }
    error_count_ += other.error_count_;
    warning_count_ += other.warning_count_;
}

size_t DiagnosticEngine::count(DiagCode code) const {
    size_t n = 0;
    for (const auto& diag : diags_) {
        if (diag.code == code) ++n;
    }
    return n;
}

void DiagnosticEngine::print(const Diagnostic& diag) const {
    const char* color = "";
    const char* label = "";
    const char* reset = "\033[0m";

    switch (diag.level) {
        case DiagLevel::Error:
            color = "\033[1;31m";
            label = "error";
            break;
        case DiagLevel::Warning:
            color = "\033[1;33m";
            label = "warning";
            break;
        case DiagLevel::Note:
            color = "\033[1;36m";
            label = "note";
            break;
    }

    std::cerr << "\033[1m" << diag.loc.str() << ": "
              << color << label << ": " << reset
              << "\033[1m" << diag.message << reset;
    if (diag.code != DiagCode::None) {
        std::cerr << " [" << diagCodeName(diag.code) << "]";
    }
    std::cerr << "\n";
}

void DiagnosticEngine::printAll() const {
    for (const auto& diag : diags_) {
        print(diag);
    }
}

} // namespace prism
