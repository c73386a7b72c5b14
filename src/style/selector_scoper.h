#pragma once

#include "common/diagnostics.h"

#include <optional>
#include <string>
#include <vector>

namespace prism {

// Reserved attribute carrying a unit's scope token on rendered elements.
inline constexpr const char* kScopeAttribute = "prism-scope";

// `[prism-scope="<token>"]`
std::string scopePredicate(const std::string& token);

// Splits a selector group on top-level commas. Commas inside strings,
// brackets and parentheses (`:is(a, b)`) do not split.
std::vector<std::string> splitSelectorGroup(const std::string& group);

// Rewrites selectors so that they only match elements rendered by one unit.
//
// The predicate is attached to the last compound of each complex selector,
// ahead of its pseudo-classes and pseudo-elements. A pierce marker (`::deep`
// or `>>>`) moves the predicate to the compound just before it and leaves
// everything after it untouched.
class SelectorScoper {
public:
    explicit SelectorScoper(std::string token);

    // Returns the rewritten group, or nullopt after reporting
    // InvalidSelector at `loc`.
    std::optional<std::string> scope(const std::string& group, const SourceLocation& loc,
                                     DiagnosticEngine& diag) const;

    // Checks an unscoped selector group without rewriting it.
    bool validate(const std::string& group, const SourceLocation& loc,
                  DiagnosticEngine& diag) const;

    const std::string& token() const { return token_; }
    const std::string& predicate() const { return predicate_; }

private:
    enum class PartKind { Compound, Combinator, Pierce };

    struct Part {
        PartKind kind;
        std::string text;   // compound text, or one of " ", ">", "+", "~"
    };

    bool split(const std::string& selector, std::vector<Part>& parts, std::string& error) const;
    bool check(const std::vector<Part>& parts, std::string& error) const;
    std::string rewrite(const std::vector<Part>& parts) const;
    std::string attach(const std::string& compound) const;

    static std::string join(std::vector<Part>::const_iterator begin,
                            std::vector<Part>::const_iterator end);

    std::string token_;
    std::string predicate_;
};

} // namespace prism
