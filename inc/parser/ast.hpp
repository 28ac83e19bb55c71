/**
 * Abstract Syntax Tree - Node Definitions
 *
 * A single node class tagged by NodeType. Each node exclusively owns its
 * children; the number and role of the children is fixed by the type:
 *
 *   PROGRAM          [COMPOUND]                      text = program name
 *   COMPOUND         [statement...]
 *   ASSIGN           [VARIABLE, expression]
 *   LOOP             [statement..., TEST, statement...]  exactly one TEST
 *   TEST             [boolean expression]
 *   IF_STATEMENT     [TEST, then, else?]
 *   WRITE / WRITELN  [value?, width?, decimals?]
 *   binary operators [left, right]                   text = operator spelling
 *   unary operators  [operand]
 *   VARIABLE         []                              text = identifier
 *   *_CONSTANT       []                              value = literal
 */

#pragma once

#include "parser/token.hpp"
#include <memory>
#include <vector>
#include <string>
#include <variant>

namespace minipas {
namespace parser {

enum class NodeType {
    // Statements
    PROGRAM,
    COMPOUND,
    ASSIGN,
    LOOP,
    TEST,
    IF_STATEMENT,
    WRITE,
    WRITELN,

    // Arithmetic
    ADD,
    SUBTRACT,
    MULTIPLY,
    DIVIDE,
    MODULUS,

    // Logical
    AND_OP,
    OR_OP,
    NOT_OP,

    // Relational
    EQ,
    LT,
    LE,
    GE,
    GT,
    NE,

    // Unary sign
    NEGATE,
    POSITIVE,

    // Leaves
    VARIABLE,
    INTEGER_CONSTANT,
    REAL_CONSTANT,
    STRING_CONSTANT
};

/**
 * Literal payload of constant nodes
 */
using Literal = std::variant<std::monostate, int64_t, double, std::string>;

class Node {
public:
    NodeType type;
    SourceLocation location;
    std::string text;
    Literal value;
    std::vector<std::unique_ptr<Node>> children;

    explicit Node(NodeType t, SourceLocation loc = SourceLocation())
        : type(t), location(loc) {}

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /**
     * Append a child, preserving order. Returns the adopted child.
     */
    Node* adopt(std::unique_ptr<Node> child);

    size_t childCount() const { return children.size(); }
    Node& child(size_t index) const { return *children.at(index); }
};

/**
 * Convert node type to string (for tree dumps and traces)
 */
const char* nodeTypeToString(NodeType type);

} // namespace parser
} // namespace minipas
