#include "style/selector_scoper.h"

#include <cctype>

namespace prism {

std::string scopePredicate(const std::string& token) {
    return std::string("[") + kScopeAttribute + "=\"" + token + "\"]";
}

static std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

static bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> splitSelectorGroup(const std::string& group) {
    std::vector<std::string> parts;
    std::string current;
    char quote = 0;
    int depth = 0;

    for (size_t i = 0; i < group.size(); ++i) {
        char c = group[i];
        if (quote) {
            current += c;
            if (c == '\\' && i + 1 < group.size()) {
                current += group[++i];
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\\' && i + 1 < group.size()) {
            current += c;
            current += group[++i];
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '(' || c == '[') {
            ++depth;
        } else if ((c == ')' || c == ']') && depth > 0) {
            --depth;
        } else if (c == ',' && depth == 0) {
            parts.push_back(trim(current));
            current.clear();
            continue;
        }
        current += c;
    }
    parts.push_back(trim(current));
    return parts;
}

SelectorScoper::SelectorScoper(std::string token)
    : token_(std::move(token)), predicate_(scopePredicate(token_)) {}

// ─── Splitting ──────────────────────────────────────────────────────

bool SelectorScoper::split(const std::string& selector, std::vector<Part>& parts,
                           std::string& error) const {
    std::string current;
    char quote = 0;
    int parens = 0;
    int brackets = 0;

    auto flush = [&]() {
        if (current.empty()) return;
        std::string compound = current;
        current.clear();

        bool pierce = false;
        if (compound == "::deep") {
            compound.clear();
            pierce = true;
        } else if (endsWith(compound, "::deep")) {
            compound.erase(compound.size() - 6);
            pierce = true;
        }

        if (!compound.empty()) {
            if (!parts.empty() && parts.back().kind == PartKind::Compound) {
                parts.push_back(Part{PartKind::Combinator, " "});
            }
            parts.push_back(Part{PartKind::Compound, compound});
        }
        if (pierce) parts.push_back(Part{PartKind::Pierce, ""});
    };

    for (size_t i = 0; i < selector.size(); ++i) {
        char c = selector[i];
        if (quote) {
            current += c;
            if (c == '\\' && i + 1 < selector.size()) {
                current += selector[++i];
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }

        // An escape keeps the next character in the compound: `.sm\:flex`, `.a\ b`.
        if (c == '\\' && i + 1 < selector.size()) {
            current += c;
            current += selector[++i];
            continue;
        }

        switch (c) {
            case '"':
            case '\'':
                quote = c;
                current += c;
                continue;
            case '(':
                ++parens;
                current += c;
                continue;
            case ')':
                if (parens == 0) {
                    error = "unbalanced ')'";
                    return false;
                }
                --parens;
                current += c;
                continue;
            case '[':
                ++brackets;
                current += c;
                continue;
            case ']':
                if (brackets == 0) {
                    error = "unbalanced ']'";
                    return false;
                }
                --brackets;
                current += c;
                continue;
            default:
                break;
        }

        if (parens > 0 || brackets > 0) {
            current += c;
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            flush();
            continue;
        }
        if (c == '>' && i + 2 < selector.size() && selector[i + 1] == '>' && selector[i + 2] == '>') {
            flush();
            parts.push_back(Part{PartKind::Pierce, ""});
            i += 2;
            continue;
        }
        if (c == '>' || c == '+' || c == '~') {
            flush();
            parts.push_back(Part{PartKind::Combinator, std::string(1, c)});
            continue;
        }
        current += c;
    }

    if (quote) {
        error = "unterminated string";
        return false;
    }
    if (parens > 0) {
        error = "unbalanced '('";
        return false;
    }
    if (brackets > 0) {
        error = "unbalanced '['";
        return false;
    }
    flush();
    return true;
}

bool SelectorScoper::check(const std::vector<Part>& parts, std::string& error) const {
    if (parts.empty()) {
        error = "empty selector";
        return false;
    }

    int pierces = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        const Part& part = parts[i];
        const Part* next = i + 1 < parts.size() ? &parts[i + 1] : nullptr;

        if (part.kind == PartKind::Combinator) {
            if (i == 0 || !next || next->kind != PartKind::Compound) {
                error = "dangling combinator '" + part.text + "'";
                return false;
            }
        } else if (part.kind == PartKind::Pierce) {
            if (++pierces > 1) {
                error = "more than one pierce marker";
                return false;
            }
            if (!next) {
                error = "nothing follows the pierce marker";
                return false;
            }
            if (i > 0 && parts[i - 1].kind == PartKind::Combinator) {
                error = "combinator before pierce marker";
                return false;
            }
        }
    }
    return true;
}

// ─── Rewriting ──────────────────────────────────────────────────────

std::string SelectorScoper::join(std::vector<Part>::const_iterator begin,
                                 std::vector<Part>::const_iterator end) {
    std::string out;
    for (auto it = begin; it != end; ++it) {
        if (it->kind == PartKind::Compound) {
            out += it->text;
        } else if (it->text == " ") {
            out += " ";
        } else {
            out += " " + it->text + " ";
        }
    }
    return out;
}

// Inserts the predicate ahead of the first top-level ':' of a compound.
std::string SelectorScoper::attach(const std::string& compound) const {
    char quote = 0;
    int depth = 0;
    for (size_t i = 0; i < compound.size(); ++i) {
        char c = compound[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\\') {
            ++i;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '(' || c == '[') {
            ++depth;
        } else if ((c == ')' || c == ']') && depth > 0) {
            --depth;
        } else if (c == ':' && depth == 0) {
            return compound.substr(0, i) + predicate_ + compound.substr(i);
        }
    }
    return compound + predicate_;
}

std::string SelectorScoper::rewrite(const std::vector<Part>& parts) const {
    size_t pierce = parts.size();
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].kind == PartKind::Pierce) pierce = i;
    }

    if (pierce == parts.size()) {
        std::string out = join(parts.begin(), parts.end() - 1);
        return out + attach(parts.back().text);
    }

    std::string out;
    if (pierce == 0) {
        out = predicate_;
    } else {
        out = join(parts.begin(), parts.begin() + static_cast<long>(pierce) - 1);
        out += attach(parts[pierce - 1].text);
    }

    auto rest = parts.begin() + static_cast<long>(pierce) + 1;
    if (rest->kind != PartKind::Combinator) out += " ";
    return out + join(rest, parts.end());
}

std::optional<std::string> SelectorScoper::scope(const std::string& group, const SourceLocation& loc,
                                                 DiagnosticEngine& diag) const {
    if (!validate(group, loc, diag)) return std::nullopt;

    std::string out;
    for (const auto& selector : splitSelectorGroup(group)) {
        std::vector<Part> parts;
        std::string error;
        split(selector, parts, error);
        if (!out.empty()) out += ", ";
        out += rewrite(parts);
    }
    return out;
}

bool SelectorScoper::validate(const std::string& group, const SourceLocation& loc,
                              DiagnosticEngine& diag) const {
    if (group.find(kScopeAttribute) != std::string::npos) {
        diag.error(DiagCode::InvalidSelector, loc,
                   "selector '" + group + "' uses the reserved attribute '" + kScopeAttribute + "'");
        return false;
    }

    for (const auto& selector : splitSelectorGroup(group)) {
        std::vector<Part> parts;
        std::string error;
        if (!split(selector, parts, error) || !check(parts, error)) {
            diag.error(DiagCode::InvalidSelector, loc, "invalid selector '" + group + "': " + error);
            return false;
        }
    }
    return true;
}

} // namespace prism
