#pragma once

#include "runtime/value.h"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace prism {

enum class RenderNodeKind {
    Element,
    Text,
    Component,
    Empty,      // a conditional with no matching arm
};

// One node of a render routine's output tree.
struct RenderNode {
    RenderNodeKind kind = RenderNodeKind::Empty;
    std::string tag;            // element tag or component name
    std::string unit;           // component unit identity
    std::string text;
    std::vector<std::pair<std::string, Value>> attributes;      // in source order
    std::vector<std::pair<std::string, std::string>> events;    // event -> method
    std::map<std::string, Value> props;
    std::map<std::string, std::vector<RenderNode>> slots;
    std::optional<Value> key;
    std::vector<RenderNode> children;

    static RenderNode element(std::string tag);
    static RenderNode textNode(std::string text);
    static RenderNode component(std::string name, std::string unit);
    static RenderNode empty();

    const Value* attribute(const std::string& name) const;

    bool operator==(const RenderNode& other) const;
    bool operator!=(const RenderNode& other) const { return !(*this == other); }
};

struct RenderInput {
    std::map<std::string, Value> props;
    std::map<std::string, Value> state;
    std::map<std::string, std::vector<RenderNode>> slots;
};

// Raised by render routines, e.g. when a required prop is missing.
class RenderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Indented outline of a rendered tree, for the CLI and test failure output.
std::string dumpRenderTree(const std::vector<RenderNode>& nodes);

} // namespace prism
