#pragma once

#include "parser/template_ast.h"

#include <sstream>
#include <string>
#include <vector>

namespace prism {

// Serializes a template back to markup that parses to a structurally
// equal tree.
class TemplatePrinter {
public:
    std::string print(const std::vector<NodePtr>& roots);
    std::string print(const TemplateNode& node);

private:
    // `prefix` carries the structural directives of wrapping Conditional
    // and Loop nodes, printed right after the tag name.
    void printNode(const TemplateNode& node, const std::string& prefix);
    void printElement(const node::Element& el, const std::string& prefix);
    void printSlot(const node::Slot& slot, const std::string& prefix);
    void printElseChain(const TemplateNode* branch);
    void printChildren(const std::vector<NodePtr>& children);

    static std::string attr(const std::string& name, const std::string& value);

    std::ostringstream out_;
};

} // namespace prism
