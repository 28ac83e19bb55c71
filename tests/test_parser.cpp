/**
 * Parser Tests - Validates AST Construction, Diagnostics and Recovery
 */

#include "parser/lexer.hpp"
#include "parser/parser.hpp"
#include "parser/ast_printer.hpp"
#include "symtab/symtab.hpp"
#include <iostream>
#include <cassert>
#include <sstream>

using namespace minipas;
using namespace minipas::parser;

struct ParseOutcome {
    std::unique_ptr<Node> tree;
    int errors;
    std::string diagnostics;
};

ParseOutcome parse(const std::string& code, symtab::Symtab& symtab) {
    std::ostringstream diagnostics;
    PascalLexer lexer(code);
    PascalParser parser(lexer, symtab, diagnostics);

    ParseOutcome outcome;
    outcome.tree = parser.parseProgram();
    outcome.errors = parser.errorCount();
    outcome.diagnostics = diagnostics.str();
    return outcome;
}

// Body goes between BEGIN (line 2) and END; its first line is line 3
std::string wrap(const std::string& body) {
    return "program test;\nbegin\n" + body + "\nend.";
}

const Node& statement(const ParseOutcome& outcome, size_t index) {
    return outcome.tree->child(0).child(index);
}

// Child counts and roles fixed by each node type
void checkShape(const Node& node) {
    size_t n = node.childCount();

    switch (node.type) {
        case NodeType::PROGRAM:
            assert(n == 1 && node.child(0).type == NodeType::COMPOUND);
            break;
        case NodeType::COMPOUND:
            break;
        case NodeType::ASSIGN:
            assert(n == 2 && node.child(0).type == NodeType::VARIABLE);
            break;
        case NodeType::LOOP: {
            size_t tests = 0;
            for (const auto& child : node.children) {
                if (child->type == NodeType::TEST) ++tests;
            }
            assert(n >= 1 && tests == 1);
            break;
        }
        case NodeType::TEST:
            assert(n == 1);
            break;
        case NodeType::IF_STATEMENT:
            assert((n == 2 || n == 3) && node.child(0).type == NodeType::TEST);
            break;
        case NodeType::WRITE:
            assert(n >= 1 && n <= 3);
            break;
        case NodeType::WRITELN:
            assert(n <= 3);
            break;
        case NodeType::ADD:
        case NodeType::SUBTRACT:
        case NodeType::MULTIPLY:
        case NodeType::DIVIDE:
        case NodeType::MODULUS:
        case NodeType::AND_OP:
        case NodeType::OR_OP:
        case NodeType::EQ:
        case NodeType::LT:
        case NodeType::LE:
        case NodeType::GE:
        case NodeType::GT:
        case NodeType::NE:
            assert(n == 2);
            break;
        case NodeType::NOT_OP:
        case NodeType::NEGATE:
        case NodeType::POSITIVE:
            assert(n == 1);
            break;
        case NodeType::VARIABLE:
        case NodeType::INTEGER_CONSTANT:
        case NodeType::REAL_CONSTANT:
        case NodeType::STRING_CONSTANT:
            assert(n == 0);
            break;
    }

    for (const auto& child : node.children) {
        checkShape(*child);
    }
}

void test_program_structure() {
    std::cout << "\n=== Test: Program Structure ===\n";

    symtab::Symtab symtab;
    auto outcome = parse("program hello; begin x := 1 end.", symtab);

    std::cout << toSExpression(*outcome.tree) << "\n";

    assert(outcome.errors == 0);
    assert(outcome.diagnostics.empty());
    assert(toSExpression(*outcome.tree) ==
           "(PROGRAM hello (COMPOUND (ASSIGN (VARIABLE x) (INTEGER_CONSTANT 1))))");

    // Program name and assignment target are both entered
    assert(symtab.lookup("hello") != nullptr);
    assert(symtab.lookup("x") != nullptr);

    checkShape(*outcome.tree);
    std::cout << "✓ Program, compound and assignment built\n";
}

void test_expression_precedence() {
    std::cout << "\n=== Test: Expression Precedence ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap(
        "x := 1 + 2 * 3;\n"
        "y := 8 - 3 - 1;\n"
        "z := -2 + 3;\n"
        "w := (1 + 2) * 3"), symtab);

    assert(outcome.errors == 0);
    checkShape(*outcome.tree);

    assert(toSExpression(statement(outcome, 0)) ==
           "(ASSIGN (VARIABLE x) (ADD (INTEGER_CONSTANT 1) "
           "(MULTIPLY (INTEGER_CONSTANT 2) (INTEGER_CONSTANT 3))))");

    // Left associative
    assert(toSExpression(statement(outcome, 1)) ==
           "(ASSIGN (VARIABLE y) (SUBTRACT (SUBTRACT (INTEGER_CONSTANT 8) "
           "(INTEGER_CONSTANT 3)) (INTEGER_CONSTANT 1)))");

    // Leading sign binds to the first term only
    assert(toSExpression(statement(outcome, 2)) ==
           "(ASSIGN (VARIABLE z) (ADD (NEGATE (INTEGER_CONSTANT 2)) (INTEGER_CONSTANT 3)))");

    assert(toSExpression(statement(outcome, 3)) ==
           "(ASSIGN (VARIABLE w) (MULTIPLY (ADD (INTEGER_CONSTANT 1) "
           "(INTEGER_CONSTANT 2)) (INTEGER_CONSTANT 3)))");

    std::cout << "✓ Expression precedence working\n";
}

void test_operator_mapping() {
    std::cout << "\n=== Test: Operator Mapping ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap(
        "a := 7 div 2 mod 3;\n"
        "b := 7 / 2;\n"
        "if (a <> b) or not (a <= b) and (a >= 1) then c := +a"), symtab);

    assert(outcome.errors == 0);
    checkShape(*outcome.tree);

    // DIV shares the real-division node with '/'
    const Node& modulus = statement(outcome, 0).child(1);
    assert(modulus.type == NodeType::MODULUS);
    assert(modulus.text == "mod");
    assert(modulus.child(0).type == NodeType::DIVIDE);
    assert(modulus.child(0).text == "div");

    const Node& slash = statement(outcome, 1).child(1);
    assert(slash.type == NodeType::DIVIDE);
    assert(slash.text == "/");

    // NOT takes a whole expression, so it swallows the AND that follows
    std::cout << toSExpression(statement(outcome, 2)) << "\n";
    assert(toSExpression(statement(outcome, 2)) ==
           "(IF_STATEMENT (TEST (OR_OP (NE (VARIABLE a) (VARIABLE b)) "
           "(NOT_OP (AND_OP (LE (VARIABLE a) (VARIABLE b)) (GE (VARIABLE a) (INTEGER_CONSTANT 1)))))) "
           "(ASSIGN (VARIABLE c) (POSITIVE (VARIABLE a))))");

    std::cout << "✓ Operators mapped to node types\n";
}

void test_while_loop() {
    std::cout << "\n=== Test: While Loop ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap(
        "i := 0;\n"
        "while i < 3 do begin i := i + 1 end"), symtab);

    assert(outcome.errors == 0);
    checkShape(*outcome.tree);

    // TEST comes first and wraps the negated condition
    std::cout << toSExpression(statement(outcome, 1)) << "\n";
    assert(toSExpression(statement(outcome, 1)) ==
           "(LOOP (TEST (NOT_OP (LT (VARIABLE i) (INTEGER_CONSTANT 3)))) "
           "(ASSIGN (VARIABLE i) (ADD (VARIABLE i) (INTEGER_CONSTANT 1))))");

    std::cout << "✓ While loop built as pre-test LOOP\n";
}

void test_repeat_loop() {
    std::cout << "\n=== Test: Repeat Loop ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap(
        "i := 0;\n"
        "repeat i := i + 1; writeln(i) until i >= 3"), symtab);

    assert(outcome.errors == 0);
    checkShape(*outcome.tree);

    // TEST comes last and holds the plain condition
    std::cout << toSExpression(statement(outcome, 1)) << "\n";
    assert(toSExpression(statement(outcome, 1)) ==
           "(LOOP (ASSIGN (VARIABLE i) (ADD (VARIABLE i) (INTEGER_CONSTANT 1))) "
           "(WRITELN (VARIABLE i)) "
           "(TEST (GE (VARIABLE i) (INTEGER_CONSTANT 3))))");

    std::cout << "✓ Repeat loop built as post-test LOOP\n";
}

void test_if_statement() {
    std::cout << "\n=== Test: If Statement ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap(
        "a := 1; b := 2;\n"
        "if a > b then x := 1 else x := 2;\n"
        "if a < b then begin y := 1; z := 2 end;\n"
        "if a = b then else w := 3"), symtab);

    assert(outcome.errors == 0);
    checkShape(*outcome.tree);

    assert(toSExpression(statement(outcome, 2)) ==
           "(IF_STATEMENT (TEST (GT (VARIABLE a) (VARIABLE b))) "
           "(ASSIGN (VARIABLE x) (INTEGER_CONSTANT 1)) "
           "(ASSIGN (VARIABLE x) (INTEGER_CONSTANT 2)))");

    assert(statement(outcome, 3).childCount() == 2);
    assert(statement(outcome, 3).child(1).type == NodeType::COMPOUND);
    assert(statement(outcome, 3).child(1).childCount() == 2);

    // Empty then-branch still occupies its slot
    assert(toSExpression(statement(outcome, 4)) ==
           "(IF_STATEMENT (TEST (EQ (VARIABLE a) (VARIABLE b))) (COMPOUND) "
           "(ASSIGN (VARIABLE w) (INTEGER_CONSTANT 3)))");

    std::cout << "✓ If-else working\n";
}

void test_write_statements() {
    std::cout << "\n=== Test: Write Statements ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap(
        "x := 3.14159;\n"
        "write(x:10:2);\n"
        "writeln('hi':5);\n"
        "writeln"), symtab);

    assert(outcome.errors == 0);
    checkShape(*outcome.tree);

    assert(toSExpression(statement(outcome, 0)) ==
           "(ASSIGN (VARIABLE x) (REAL_CONSTANT 3.14159))");
    assert(toSExpression(statement(outcome, 1)) ==
           "(WRITE (VARIABLE x) (INTEGER_CONSTANT 10) (INTEGER_CONSTANT 2))");
    assert(toSExpression(statement(outcome, 2)) ==
           "(WRITELN (STRING_CONSTANT 'hi') (INTEGER_CONSTANT 5))");
    assert(toSExpression(statement(outcome, 3)) == "(WRITELN)");

    const Node& str = statement(outcome, 2).child(0);
    assert(std::get<std::string>(str.value) == "hi");

    std::cout << "✓ Write arguments parsed\n";
}

void test_write_restrictions() {
    std::cout << "\n=== Test: Write Restrictions ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap(
        "x := 1;\n"
        "write(x:x);\n"
        "write(x:5:1.5);\n"
        "write(1 + 2);\n"
        "write x"), symtab);

    std::cout << outcome.diagnostics;

    assert(outcome.errors == 4);
    assert(outcome.diagnostics.find(
        "SYNTAX ERROR at line 4: Invalid field width at 'x'") != std::string::npos);
    assert(outcome.diagnostics.find(
        "SYNTAX ERROR at line 5: Invalid count of decimal places at '1.5'") != std::string::npos);
    assert(outcome.diagnostics.find(
        "SYNTAX ERROR at line 6: Invalid WRITE or WRITELN statement at '1'") != std::string::npos);
    assert(outcome.diagnostics.find(
        "SYNTAX ERROR at line 7: Missing left parenthesis at 'x'") != std::string::npos);

    // Only the assignment survives
    assert(outcome.tree->child(0).childCount() == 1);

    std::cout << "✓ Width and decimals must be integer literals\n";
}

void test_undeclared_identifier() {
    std::cout << "\n=== Test: Undeclared Identifier ===\n";

    symtab::Symtab symtab;
    auto outcome = parse("program p;\nbegin\n  writeln(z)\nend.", symtab);

    std::cout << outcome.diagnostics;

    assert(outcome.errors == 1);
    assert(outcome.diagnostics ==
           "SEMANTIC ERROR at line 3: Undeclared identifier at 'z'\n");

    // The node is still built
    assert(toSExpression(statement(outcome, 0)) == "(WRITELN (VARIABLE z))");
    assert(symtab.lookup("z") == nullptr);

    std::cout << "✓ Semantic error counted once, parsing continued\n";
}

void test_case_insensitive_identifiers() {
    std::cout << "\n=== Test: Case-Insensitive Identifiers ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap("Total := 1;\nwriteln(TOTAL);\ntotal := total + 1"), symtab);

    assert(outcome.errors == 0);
    assert(symtab.size() == 2);  // program name and total

    std::cout << "✓ Identifiers resolve regardless of case\n";
}

void test_syntax_error_recovery() {
    std::cout << "\n=== Test: Syntax Error Recovery ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap(
        "x := 1;\n"
        "y := * 2;\n"
        "z := 3"), symtab);

    std::cout << outcome.diagnostics;

    assert(outcome.errors == 1);
    assert(outcome.diagnostics ==
           "SYNTAX ERROR at line 4: Unexpected token at '*'\n");

    // The malformed statement is dropped, its neighbours survive
    const Node& compound = outcome.tree->child(0);
    assert(compound.childCount() == 2);
    assert(compound.child(0).child(0).text == "x");
    assert(compound.child(1).child(0).text == "z");
    checkShape(*outcome.tree);

    std::cout << "✓ Recovered at the next statement\n";
}

void test_multiple_errors_one_pass() {
    std::cout << "\n=== Test: Multiple Errors ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap(
        "x := 1\n"
        "y := 2;\n"
        "z = 3;\n"
        "w := (1 + 2;\n"
        "writeln(x)"), symtab);

    std::cout << outcome.diagnostics;

    assert(outcome.errors == 3);
    assert(outcome.diagnostics.find("SYNTAX ERROR at line 4: Missing ; at 'y'") != std::string::npos);
    assert(outcome.diagnostics.find("SYNTAX ERROR at line 5: Missing := at '='") != std::string::npos);
    assert(outcome.diagnostics.find("SYNTAX ERROR at line 6: Expecting ) at ';'") != std::string::npos);

    // x, y and the writeln remain
    assert(outcome.tree->child(0).childCount() == 3);

    std::cout << "✓ All errors found in one pass\n";
}

void test_stray_tokens_terminate() {
    std::cout << "\n=== Test: Stray Tokens ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap(
        "x := 1;\n"
        "else x := 2;\n"
        "repeat x := 3 end"), symtab);

    std::cout << outcome.diagnostics;

    assert(outcome.errors == 2);
    assert(outcome.diagnostics.find("Unexpected token at 'else'") != std::string::npos);
    assert(outcome.diagnostics.find("Expecting UNTIL at 'end'") != std::string::npos);

    std::cout << "✓ Stray ELSE and missing UNTIL reported, parse finished\n";
}

void test_program_header_errors() {
    std::cout << "\n=== Test: Program Header Errors ===\n";

    symtab::Symtab symtab;
    auto outcome = parse("begin x := 1 end", symtab);

    std::cout << outcome.diagnostics;

    assert(outcome.errors == 4);
    assert(outcome.diagnostics.find("Expecting PROGRAM at 'begin'") != std::string::npos);
    assert(outcome.diagnostics.find("Expecting program name at 'begin'") != std::string::npos);
    assert(outcome.diagnostics.find("Missing ; at 'begin'") != std::string::npos);
    assert(outcome.diagnostics.find("Expecting . at ''") != std::string::npos);

    // The body is still parsed
    assert(toSExpression(outcome.tree->child(0)) ==
           "(COMPOUND (ASSIGN (VARIABLE x) (INTEGER_CONSTANT 1)))");
    checkShape(*outcome.tree);

    std::cout << "✓ Header errors reported, body still parsed\n";
}

void test_empty_statements() {
    std::cout << "\n=== Test: Empty Statements ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap("; ;\nx := 1;;\n;"), symtab);

    assert(outcome.errors == 0);
    assert(outcome.tree->child(0).childCount() == 1);

    std::cout << "✓ Empty statements allowed\n";
}

void test_line_numbers() {
    std::cout << "\n=== Test: Line Numbers ===\n";

    symtab::Symtab symtab;
    auto outcome = parse(wrap("x := 1;\n\ny := x / 2"), symtab);

    assert(outcome.errors == 0);
    assert(statement(outcome, 0).location.line == 3);
    assert(statement(outcome, 1).location.line == 5);
    assert(statement(outcome, 1).child(1).location.line == 5);

    std::cout << "✓ Nodes carry source lines\n";
}

int main() {
    try {
        test_program_structure();
        test_expression_precedence();
        test_operator_mapping();
        test_while_loop();
        test_repeat_loop();
        test_if_statement();
        test_write_statements();
        test_write_restrictions();
        test_undeclared_identifier();
        test_case_insensitive_identifiers();
        test_syntax_error_recovery();
        test_multiple_errors_one_pass();
        test_stray_tokens_terminate();
        test_program_header_errors();
        test_empty_statements();
        test_line_numbers();

        std::cout << "\n✅ All parser tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
