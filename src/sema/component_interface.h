#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace prism {

struct PropInfo {
    std::string name;
    std::string type;
    bool required = true;
    std::string default_value;  // source form of the default, empty when required
};

// What dependents bind against: a unit's props and slots.
struct ComponentInterface {
    std::string unit;
    std::string scope_token;
    std::vector<PropInfo> props;        // declaration order
    std::vector<std::string> slots;     // document order, "" is the default slot

    const PropInfo* findProp(const std::string& name) const {
        for (const auto& prop : props) {
            if (prop.name == name) return &prop;
        }
        return nullptr;
    }

    bool hasSlot(const std::string& name) const {
        for (const auto& slot : slots) {
            if (slot == name) return true;
        }
        return false;
    }

    bool operator==(const ComponentInterface& other) const {
        if (unit != other.unit || scope_token != other.scope_token ||
            slots != other.slots || props.size() != other.props.size()) {
            return false;
        }
        for (size_t i = 0; i < props.size(); ++i) {
            const auto& a = props[i];
            const auto& b = other.props[i];
            if (a.name != b.name || a.type != b.type || a.required != b.required ||
                a.default_value != b.default_value) {
                return false;
            }
        }
        return true;
    }
    bool operator!=(const ComponentInterface& other) const { return !(*this == other); }
};

// Interfaces of the units a unit imports, keyed by unit identity. A unit
// that failed to compile maps to nullopt; a unit that does not exist is
// absent.
using DependencyMap = std::map<std::string, std::optional<ComponentInterface>>;

} // namespace prism
