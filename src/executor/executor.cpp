/**
 * AST Executor Implementation
 */

#include "executor/executor.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace minipas {
namespace executor {

using parser::Node;
using parser::NodeType;

namespace {

// Negative width left-justifies, as with printf's '-' flag
std::string pad(const std::string& text, long width) {
    size_t target = static_cast<size_t>(width < 0 ? -width : width);
    if (text.size() >= target) {
        return text;
    }
    std::string fill(target - text.size(), ' ');
    return width < 0 ? text + fill : fill + text;
}

// Shortest "%e" form that reads back as the same double
std::string shortestScientific(double value) {
    char buffer[32];
    for (int precision = 0; precision < 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*e", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    return buffer;
}

/**
 * Fixed-point text with the given number of decimals, rounding half away
 * from zero on the shortest decimal form of the value.
 * So 2.5 -> "3" and 0.125 -> "0.13" at two places.
 */
std::string formatFixed(double value, long decimals) {
    if (!std::isfinite(value)) {
        std::ostringstream out;
        out << value;
        return out.str();
    }

    // "-d.ddde+XX": collect significant digits and the exponent of the first
    std::string scientific = shortestScientific(std::fabs(value));
    size_t e = scientific.find('e');
    std::string digits;
    for (size_t i = 0; i < e; ++i) {
        if (scientific[i] != '.') digits += scientific[i];
    }
    long exponent = std::strtol(scientific.c_str() + e + 1, nullptr, 10);

    // Index of the digit in the last kept decimal place
    long last = exponent + decimals;

    std::string scaled;   // |value| * 10^decimals, rounded
    if (last >= 0) {
        size_t kept = static_cast<size_t>(last) + 1;
        if (kept <= digits.size()) {
            scaled = digits.substr(0, kept);
        } else {
            scaled = digits + std::string(kept - digits.size(), '0');
        }
    }

    size_t roundIndex = static_cast<size_t>(last + 1);
    if (last + 1 >= 0 && roundIndex < digits.size() && digits[roundIndex] >= '5') {
        size_t i = scaled.size();
        while (i > 0 && scaled[i - 1] == '9') {
            scaled[--i] = '0';
        }
        if (i == 0) {
            scaled.insert(scaled.begin(), '1');
        } else {
            ++scaled[i - 1];
        }
    }

    size_t places = static_cast<size_t>(decimals);
    if (scaled.size() <= places) {
        scaled.insert(0, places + 1 - scaled.size(), '0');
    }
    if (places > 0) {
        scaled.insert(scaled.size() - places, ".");
    }

    return std::signbit(value) ? "-" + scaled : scaled;
}

} // namespace

// =============================================================================
// Entry Point
// =============================================================================

void Executor::execute(const Node& program) {
    if (program.type != NodeType::PROGRAM || program.childCount() != 1) {
        throw std::invalid_argument("Executor::execute expects a PROGRAM node");
    }
    lineNumber_ = program.location.line;
    executeStatement(program.child(0));
}

symtab::SymtabEntry& Executor::entryFor(const Node& variable) const {
    symtab::SymtabEntry* entry = symtab_.lookup(variable.text);
    if (!entry) {
        // Only reachable when a tree with parse errors is executed
        throw std::logic_error("Unresolved variable: " + variable.text);
    }
    return *entry;
}

[[noreturn]] void Executor::runtimeError(const Node& node, const std::string& message) {
    RuntimeError error(lineNumber_, message, node.text);
    diagnostics_ << error.what() << std::endl;
    throw error;
}

// =============================================================================
// Statements
// =============================================================================

void Executor::executeStatement(const Node& node) {
    lineNumber_ = node.location.line;

    if (trace_) {
        diagnostics_ << "[TRACE] line " << lineNumber_ << ": "
                     << parser::nodeTypeToString(node.type) << "\n";
    }

    switch (node.type) {
        case NodeType::COMPOUND:     executeCompound(node); return;
        case NodeType::ASSIGN:       executeAssign(node);   return;
        case NodeType::LOOP:         executeLoop(node);     return;
        case NodeType::IF_STATEMENT: executeIf(node);       return;
        case NodeType::WRITE:
        case NodeType::WRITELN:      executeWrite(node);    return;

        case NodeType::PROGRAM:
        case NodeType::TEST:
        case NodeType::ADD:
        case NodeType::SUBTRACT:
        case NodeType::MULTIPLY:
        case NodeType::DIVIDE:
        case NodeType::MODULUS:
        case NodeType::AND_OP:
        case NodeType::OR_OP:
        case NodeType::NOT_OP:
        case NodeType::EQ:
        case NodeType::LT:
        case NodeType::LE:
        case NodeType::GE:
        case NodeType::GT:
        case NodeType::NE:
        case NodeType::NEGATE:
        case NodeType::POSITIVE:
        case NodeType::VARIABLE:
        case NodeType::INTEGER_CONSTANT:
        case NodeType::REAL_CONSTANT:
        case NodeType::STRING_CONSTANT:
            break;
    }
    throw std::logic_error(std::string("Not a statement: ") +
                           parser::nodeTypeToString(node.type));
}

void Executor::executeCompound(const Node& node) {
    for (const auto& stmt : node.children) {
        executeStatement(*stmt);
    }
}

void Executor::executeAssign(const Node& node) {
    const Node& target = node.child(0);
    double value = evaluateNumber(node.child(1));
    entryFor(target).setValue(value);
}

void Executor::executeLoop(const Node& node) {
    // Children run in order; reaching a TEST that holds ends the loop.
    // WHILE puts its TEST first, REPEAT puts it last.
    while (true) {
        for (const auto& child : node.children) {
            if (child->type == NodeType::TEST) {
                if (evaluateTest(*child)) return;
            } else {
                executeStatement(*child);
            }
        }
    }
}

void Executor::executeIf(const Node& node) {
    if (evaluateTest(node.child(0))) {
        executeStatement(node.child(1));
    } else if (node.childCount() == 3) {
        executeStatement(node.child(2));
    }
}

void Executor::executeWrite(const Node& node) {
    if (node.childCount() > 0) {
        printValue(node);
    }
    if (node.type == NodeType::WRITELN) {
        out_ << "\n";
    }
    out_.flush();
}

void Executor::printValue(const Node& node) {
    long fieldWidth = 0;       // 0 = no padding
    long decimalPlaces = 0;

    if (node.childCount() > 1) {
        double width = evaluateNumber(node.child(1));
        if (std::fabs(width) > MAX_FIELD_WIDTH) {
            runtimeError(node.child(1), "Field width out of range");
        }
        fieldWidth = static_cast<long>(width);

        if (node.childCount() > 2) {
            double places = evaluateNumber(node.child(2));
            if (places < 0 || places > MAX_DECIMAL_PLACES) {
                runtimeError(node.child(2), "Decimal places out of range");
            }
            decimalPlaces = static_cast<long>(places);
        }
    }

    const Node& valueNode = node.child(0);
    Value value = evaluate(valueNode);

    if (std::holds_alternative<double>(value)) {
        out_ << pad(formatFixed(std::get<double>(value), decimalPlaces), fieldWidth);
    }
    else if (std::holds_alternative<std::string>(value)) {
        out_ << pad(std::get<std::string>(value), fieldWidth);
    }
    else {
        runtimeError(valueNode, "Invalid operand type");
    }
}

// =============================================================================
// Expressions
// =============================================================================

bool Executor::evaluateTest(const Node& test) {
    return evaluateBoolean(test.child(0));
}

double Executor::evaluateNumber(const Node& node) {
    Value value = evaluate(node);
    if (!std::holds_alternative<double>(value)) {
        runtimeError(node, "Invalid operand type");
    }
    return std::get<double>(value);
}

bool Executor::evaluateBoolean(const Node& node) {
    Value value = evaluate(node);
    if (!std::holds_alternative<bool>(value)) {
        runtimeError(node, "Invalid operand type");
    }
    return std::get<bool>(value);
}

Value Executor::evaluate(const Node& node) {
    switch (node.type) {
        case NodeType::VARIABLE:
            return entryFor(node).getValue();

        case NodeType::INTEGER_CONSTANT:
            if (const int64_t* literal = std::get_if<int64_t>(&node.value)) {
                return static_cast<double>(*literal);
            }
            break;

        case NodeType::REAL_CONSTANT:
            if (const double* literal = std::get_if<double>(&node.value)) {
                return *literal;
            }
            break;

        case NodeType::STRING_CONSTANT:
            if (const std::string* literal = std::get_if<std::string>(&node.value)) {
                return *literal;
            }
            break;

        case NodeType::NOT_OP:
            return !evaluateBoolean(node.child(0));

        case NodeType::NEGATE:
            return -evaluateNumber(node.child(0));

        case NodeType::POSITIVE:
            return evaluateNumber(node.child(0));

        // Both operands are always evaluated
        case NodeType::AND_OP: {
            bool left = evaluateBoolean(node.child(0));
            bool right = evaluateBoolean(node.child(1));
            return left && right;
        }
        case NodeType::OR_OP: {
            bool left = evaluateBoolean(node.child(0));
            bool right = evaluateBoolean(node.child(1));
            return left || right;
        }

        case NodeType::EQ:
        case NodeType::LT:
        case NodeType::LE:
        case NodeType::GE:
        case NodeType::GT:
        case NodeType::NE: {
            double left = evaluateNumber(node.child(0));
            double right = evaluateNumber(node.child(1));
            return applyComparison(node.type, left, right);
        }

        case NodeType::ADD:
        case NodeType::SUBTRACT:
        case NodeType::MULTIPLY:
        case NodeType::DIVIDE:
        case NodeType::MODULUS: {
            double left = evaluateNumber(node.child(0));
            double right = evaluateNumber(node.child(1));
            return applyArithmetic(node, left, right);
        }

        case NodeType::PROGRAM:
        case NodeType::COMPOUND:
        case NodeType::ASSIGN:
        case NodeType::LOOP:
        case NodeType::TEST:
        case NodeType::IF_STATEMENT:
        case NodeType::WRITE:
        case NodeType::WRITELN:
            throw std::logic_error(std::string("Not an expression: ") +
                                   parser::nodeTypeToString(node.type));
    }
    throw std::logic_error(std::string("Malformed constant: ") + node.text);
}

Value Executor::applyArithmetic(const Node& node, double left, double right) {
    switch (node.type) {
        case NodeType::ADD:      return left + right;
        case NodeType::SUBTRACT: return left - right;
        case NodeType::MULTIPLY: return left * right;

        case NodeType::DIVIDE:
            if (right == 0.0) runtimeError(node, "Division by zero");
            return left / right;

        case NodeType::MODULUS:
            if (right == 0.0) runtimeError(node, "Division by zero");
            return std::fmod(left, right);

        default:
            throw std::logic_error("Unknown arithmetic operator");
    }
}

bool Executor::applyComparison(NodeType type, double left, double right) const {
    switch (type) {
        case NodeType::EQ: return left == right;
        case NodeType::LT: return left < right;
        case NodeType::LE: return left <= right;
        case NodeType::GE: return left >= right;
        case NodeType::GT: return left > right;
        case NodeType::NE: return left != right;
        default: throw std::logic_error("Unknown comparison operator");
    }
}

} // namespace executor
} // namespace minipas
