/**
 * AST Printer Implementation
 */

#include "parser/ast_printer.hpp"
#include <sstream>

namespace minipas {
namespace parser {

namespace {

bool printsText(const Node& node) {
    switch (node.type) {
        case NodeType::PROGRAM:
        case NodeType::VARIABLE:
        case NodeType::INTEGER_CONSTANT:
        case NodeType::REAL_CONSTANT:
        case NodeType::STRING_CONSTANT:
            return !node.text.empty();
        default:
            return false;
    }
}

void writeHead(const Node& node, std::ostream& out) {
    out << "(" << nodeTypeToString(node.type);
    if (printsText(node)) {
        out << " " << node.text;
    }
}

void writeFlat(const Node& node, std::ostream& out) {
    writeHead(node, out);
    for (const auto& child : node.children) {
        out << " ";
        writeFlat(*child, out);
    }
    out << ")";
}

void writeIndented(const Node& node, std::ostream& out, size_t depth) {
    out << std::string(depth * 2, ' ');
    writeHead(node, out);
    if (node.children.empty()) {
        out << ")\n";
        return;
    }
    out << "\n";
    for (const auto& child : node.children) {
        writeIndented(*child, out, depth + 1);
    }
    out << std::string(depth * 2, ' ') << ")\n";
}

} // namespace

std::string toSExpression(const Node& node) {
    std::ostringstream out;
    writeFlat(node, out);
    return out.str();
}

void printTree(const Node& node, std::ostream& out) {
    writeIndented(node, out, 0);
}

} // namespace parser
} // namespace minipas
