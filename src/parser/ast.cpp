/**
 * AST Implementation
 */

#include "parser/ast.hpp"
#include <stdexcept>

namespace minipas {
namespace parser {

Node* Node::adopt(std::unique_ptr<Node> child) {
    if (!child) {
        throw std::invalid_argument("Node::adopt: null child");
    }
    children.push_back(std::move(child));
    return children.back().get();
}

const char* nodeTypeToString(NodeType type) {
    switch (type) {
        case NodeType::PROGRAM: return "PROGRAM";
        case NodeType::COMPOUND: return "COMPOUND";
        case NodeType::ASSIGN: return "ASSIGN";
        case NodeType::LOOP: return "LOOP";
        case NodeType::TEST: return "TEST";
        case NodeType::IF_STATEMENT: return "IF_STATEMENT";
        case NodeType::WRITE: return "WRITE";
        case NodeType::WRITELN: return "WRITELN";
        case NodeType::ADD: return "ADD";
        case NodeType::SUBTRACT: return "SUBTRACT";
        case NodeType::MULTIPLY: return "MULTIPLY";
        case NodeType::DIVIDE: return "DIVIDE";
        case NodeType::MODULUS: return "MODULUS";
        case NodeType::AND_OP: return "AND_OP";
        case NodeType::OR_OP: return "OR_OP";
        case NodeType::NOT_OP: return "NOT_OP";
        case NodeType::EQ: return "EQ";
        case NodeType::LT: return "LT";
        case NodeType::LE: return "LE";
        case NodeType::GE: return "GE";
        case NodeType::GT: return "GT";
        case NodeType::NE: return "NE";
        case NodeType::NEGATE: return "NEGATE";
        case NodeType::POSITIVE: return "POSITIVE";
        case NodeType::VARIABLE: return "VARIABLE";
        case NodeType::INTEGER_CONSTANT: return "INTEGER_CONSTANT";
        case NodeType::REAL_CONSTANT: return "REAL_CONSTANT";
        case NodeType::STRING_CONSTANT: return "STRING_CONSTANT";
    }
    return "UNKNOWN";
}

} // namespace parser
} // namespace minipas
