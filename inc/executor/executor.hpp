/**
 * AST Executor - Interprets parsed minipas programs
 *
 * Walks the tree produced by PascalParser and produces side effects:
 * - Variable values stored in the symbol table
 * - WRITE / WRITELN output on the output stream
 *
 * Division by zero (DIVIDE or MODULUS) and operands of the wrong kind are
 * fatal: one RUNTIME ERROR line goes to the diagnostic stream and a
 * RuntimeError is thrown. Nothing in the executor catches it, so no
 * further statement runs.
 */

#ifndef MINIPAS_EXECUTOR_HPP
#define MINIPAS_EXECUTOR_HPP

#include "parser/ast.hpp"
#include "symtab/symtab.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>

namespace minipas {
namespace executor {

// Runtime value types
using Value = std::variant<
    double,            // Every number is a real
    std::string,       // Only ever a WRITE argument
    bool               // Relational and logical results
>;

// Process exit status after a runtime error
constexpr int RUNTIME_ERROR_STATUS = 2;

// Bounds on the ':width:decimals' suffix of WRITE / WRITELN
constexpr long MAX_FIELD_WIDTH = 1000;
constexpr long MAX_DECIMAL_PLACES = 100;

/**
 * Fatal runtime error. The diagnostic line has already been written when
 * this is thrown; a caller that catches it must not resume execution and
 * should exit with exitStatus().
 */
class RuntimeError : public std::runtime_error {
public:
    RuntimeError(size_t line, const std::string& msg, const std::string& text)
        : std::runtime_error(formatError(line, msg, text))
        , line(line)
        , message(msg)
        , nodeText(text) {}

    size_t line;
    std::string message;
    std::string nodeText;

    int exitStatus() const { return RUNTIME_ERROR_STATUS; }

private:
    static std::string formatError(size_t line, const std::string& msg, const std::string& text) {
        return "RUNTIME ERROR at line " + std::to_string(line) + ": " + msg + ": " + text;
    }
};

/**
 * Executor - interprets AST and produces side effects
 */
class Executor {
public:
    explicit Executor(symtab::Symtab& symtab,
                      std::ostream& out = std::cout,
                      std::ostream& diagnostics = std::cerr)
        : symtab_(symtab), out_(out), diagnostics_(diagnostics) {}

    // Execute a PROGRAM node
    void execute(const parser::Node& program);

    // Echo each executed statement to the diagnostic stream
    void setTrace(bool enabled) { trace_ = enabled; }

private:
    symtab::SymtabEntry& entryFor(const parser::Node& variable) const;

    // Statements (produce side effects)
    void executeStatement(const parser::Node& node);
    void executeCompound(const parser::Node& node);
    void executeAssign(const parser::Node& node);
    void executeLoop(const parser::Node& node);
    void executeIf(const parser::Node& node);
    void executeWrite(const parser::Node& node);
    void printValue(const parser::Node& node);

    // Expressions (produce values)
    Value evaluate(const parser::Node& node);
    bool evaluateTest(const parser::Node& test);
    double evaluateNumber(const parser::Node& node);
    bool evaluateBoolean(const parser::Node& node);
    Value applyArithmetic(const parser::Node& node, double left, double right);
    bool applyComparison(parser::NodeType type, double left, double right) const;

    [[noreturn]] void runtimeError(const parser::Node& node, const std::string& message);

    symtab::Symtab& symtab_;
    std::ostream& out_;
    std::ostream& diagnostics_;
    size_t lineNumber_ = 0;   // Line of the statement being executed
    bool trace_ = false;
};

} // namespace executor
} // namespace minipas

#endif // MINIPAS_EXECUTOR_HPP
