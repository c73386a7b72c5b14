#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace prism {

// Import graph of one build pass. Edges point from a unit to the units it
// imports; imports of unknown units are kept so they can be reported.
class DependencyGraph {
public:
    void addUnit(const std::string& unit, std::vector<std::string> imports);

    bool contains(const std::string& unit) const;
    const std::vector<std::string>& imports(const std::string& unit) const;
    const std::vector<std::string>& units() const { return units_; }

    // Units that import `unit` directly.
    std::vector<std::string> dependents(const std::string& unit) const;
    // `unit` and everything that depends on it, directly or not.
    std::set<std::string> dependentClosure(const std::string& unit) const;

    // One entry per import cycle (strongly connected component with more
    // than one unit, or a unit importing itself), members in sorted order.
    std::vector<std::vector<std::string>> findCycles() const;

private:
    void strongConnect(const std::string& unit, std::map<std::string, int>& index,
                       std::map<std::string, int>& low, std::vector<std::string>& stack,
                       std::set<std::string>& onStack, int& counter,
                       std::vector<std::vector<std::string>>& out) const;

    std::vector<std::string> units_;
    std::map<std::string, std::vector<std::string>> imports_;
};

} // namespace prism
