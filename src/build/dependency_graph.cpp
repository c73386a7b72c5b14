#include "build/dependency_graph.h"

#include <algorithm>

namespace prism {

void DependencyGraph::addUnit(const std::string& unit, std::vector<std::string> imports) {
    if (!contains(unit)) units_.push_back(unit);
    imports_[unit] = std::move(imports);
}

bool DependencyGraph::contains(const std::string& unit) const {
    return imports_.count(unit) > 0;
}

const std::vector<std::string>& DependencyGraph::imports(const std::string& unit) const {
    static const std::vector<std::string> none;
    auto it = imports_.find(unit);
    return it == imports_.end() ? none : it->second;
}

std::vector<std::string> DependencyGraph::dependents(const std::string& unit) const {
    std::vector<std::string> result;
    for (const auto& candidate : units_) {
        const auto& deps = imports(candidate);
        if (std::find(deps.begin(), deps.end(), unit) != deps.end()) {
            result.push_back(candidate);
        }
    }
    return result;
}

std::set<std::string> DependencyGraph::dependentClosure(const std::string& unit) const {
    std::set<std::string> seen{unit};
    std::vector<std::string> work{unit};
    while (!work.empty()) {
        std::string current = work.back();
        work.pop_back();
        for (const auto& dependent : dependents(current)) {
            if (seen.insert(dependent).second) work.push_back(dependent);
        }
    }
    return seen;
}

// ─── Cycles ─────────────────────────────────────────────────────────
// Tarjan's algorithm: every strongly connected component is reported once,
// however many back edges it has.

void DependencyGraph::strongConnect(const std::string& unit, std::map<std::string, int>& index,
                                    std::map<std::string, int>& low, std::vector<std::string>& stack,
                                    std::set<std::string>& onStack, int& counter,
                                    std::vector<std::vector<std::string>>& out) const {
    index[unit] = low[unit] = counter++;
    stack.push_back(unit);
    onStack.insert(unit);

    for (const auto& dep : imports(unit)) {
        if (!contains(dep)) continue;
        if (!index.count(dep)) {
            strongConnect(dep, index, low, stack, onStack, counter, out);
            low[unit] = std::min(low[unit], low[dep]);
        } else if (onStack.count(dep)) {
            low[unit] = std::min(low[unit], index[dep]);
        }
    }

    if (low[unit] != index[unit]) return;

    std::vector<std::string> component;
    std::string member;
    do {
        member = stack.back();
        stack.pop_back();
        onStack.erase(member);
        component.push_back(member);
    } while (member != unit);

    const auto& self = imports(unit);
    bool selfLoop = std::find(self.begin(), self.end(), unit) != self.end();
    if (component.size() > 1 || selfLoop) {
        std::sort(component.begin(), component.end());
        out.push_back(std::move(component));
    }
}

std::vector<std::vector<std::string>> DependencyGraph::findCycles() const {
    std::map<std::string, int> index;
    std::map<std::string, int> low;
    std::vector<std::string> stack;
    std::set<std::string> onStack;
    int counter = 0;
    std::vector<std::vector<std::string>> cycles;

    std::vector<std::string> ordered = units_;
    std::sort(ordered.begin(), ordered.end());
    for (const auto& unit : ordered) {
        if (!index.count(unit)) {
            strongConnect(unit, index, low, stack, onStack, counter, cycles);
        }
    }
    std::sort(cycles.begin(), cycles.end());
    return cycles;
}

} // namespace prism
