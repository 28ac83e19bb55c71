/**
 * AST Printer - renders trees for tests and the --ast flag
 *
 * Leaves print their source text:  (VARIABLE x)  (INTEGER_CONSTANT 5)
 * PROGRAM prints its name; every other node prints only its type and
 * children, e.g. (ASSIGN (VARIABLE x) (ADD (VARIABLE y) (INTEGER_CONSTANT 1)))
 */

#pragma once

#include "parser/ast.hpp"
#include <ostream>
#include <string>

namespace minipas {
namespace parser {

/**
 * Single-line parenthesized form
 */
std::string toSExpression(const Node& node);

/**
 * Same form, one node per line, indented two spaces per level
 */
void printTree(const Node& node, std::ostream& out);

} // namespace parser
} // namespace minipas
