#include "runtime/render_node.h"

#include <sstream>

namespace prism {

RenderNode RenderNode::element(std::string tag) {
    RenderNode node;
    node.kind = RenderNodeKind::Element;
    node.tag = std::move(tag);
    return node;
}

RenderNode RenderNode::textNode(std::string text) {
    RenderNode node;
    node.kind = RenderNodeKind::Text;
    node.text = std::move(text);
    return node;
}

RenderNode RenderNode::component(std::string name, std::string unit) {
    RenderNode node;
    node.kind = RenderNodeKind::Component;
    node.tag = std::move(name);
    node.unit = std::move(unit);
    return node;
}

RenderNode RenderNode::empty() {
    return RenderNode{};
}

const Value* RenderNode::attribute(const std::string& name) const {
    for (const auto& [attr, value] : attributes) {
        if (attr == name) return &value;
    }
    return nullptr;
}

bool RenderNode::operator==(const RenderNode& other) const {
    return kind == other.kind && tag == other.tag && unit == other.unit &&
           text == other.text && attributes == other.attributes && events == other.events &&
           props == other.props && slots == other.slots && key == other.key &&
           children == other.children;
}

// ─── Dump ───────────────────────────────────────────────────────────

static void dumpNode(std::ostringstream& out, const RenderNode& node, int depth);

static void dumpNodes(std::ostringstream& out, const std::vector<RenderNode>& nodes, int depth) {
    for (const auto& node : nodes) {
        dumpNode(out, node, depth);
    }
}

static void dumpNode(std::ostringstream& out, const RenderNode& node, int depth) {
    std::string pad(static_cast<size_t>(depth) * 2, ' ');
    out << pad;

    switch (node.kind) {
        case RenderNodeKind::Text:
            out << "\"" << node.text << "\"";
            break;
        case RenderNodeKind::Empty:
            out << "<empty>";
            break;
        case RenderNodeKind::Element:
            out << "<" << node.tag;
            for (const auto& [name, value] : node.attributes) {
                out << " " << name << "=" << value.toJson();
            }
            for (const auto& [event, method] : node.events) {
                out << " @" << event << "=" << method;
            }
            out << ">";
            break;
        case RenderNodeKind::Component:
            out << "<" << node.tag << " unit=" << node.unit;
            for (const auto& [name, value] : node.props) {
                out << " " << name << "=" << value.toJson();
            }
            out << ">";
            break;
    }
    if (node.key) out << " key=" << node.key->toJson();
    out << "\n";

    dumpNodes(out, node.children, depth + 1);
    for (const auto& [slot, content] : node.slots) {
        out << pad << "  #" << (slot.empty() ? "default" : slot) << "\n";
        dumpNodes(out, content, depth + 2);
    }
}

std::string dumpRenderTree(const std::vector<RenderNode>& nodes) {
    std::ostringstream out;
    dumpNodes(out, nodes, 0);
    return out.str();
}

} // namespace prism
