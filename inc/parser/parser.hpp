/**
 * Recursive Descent Parser for the minipas teaching language
 *
 * One method per grammar nonterminal, one token of lookahead pulled from
 * a TokenSource. Builds the tree described in parser/ast.hpp and enters
 * assignment targets into the symbol table as they are first seen.
 *
 * Error handling:
 * - Syntax errors inside a statement throw ParseError; the enclosing
 *   statement list reports it, drops the statement, and skips ahead to
 *   the next ';', END, UNTIL or end of input.
 * - Reading an identifier that was never assigned is a semantic error;
 *   it is reported and counted but parsing carries on.
 *
 * The tree is only fit to execute when errorCount() is zero.
 */

#ifndef MINIPAS_PARSER_HPP
#define MINIPAS_PARSER_HPP

#include "parser/token.hpp"
#include "parser/lexer.hpp"
#include "parser/ast.hpp"
#include "symtab/symtab.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace minipas {
namespace parser {

class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& msg, const Token& tok)
        : std::runtime_error(formatError(msg, tok)), token(tok) {}

    Token token;

private:
    static std::string formatError(const std::string& msg, const Token& tok) {
        return "SYNTAX ERROR at line " + std::to_string(tok.location.line) +
               ": " + msg + " at '" + tok.lexeme + "'";
    }
};

class PascalParser {
public:
    PascalParser(TokenSource& source, symtab::Symtab& symtab,
                 std::ostream& diagnostics = std::cerr)
        : source_(source), symtab_(symtab), diagnostics_(diagnostics) {}

    // Entry point - parses complete program
    std::unique_ptr<Node> parseProgram();

    // Syntax plus semantic errors seen so far
    int errorCount() const { return errorCount_; }

private:
    // Token stream management
    Token consume();
    bool check(TokenType type) const;
    bool match(TokenType type);
    void expect(TokenType type, const std::string& message);

    // Statement parsing
    std::unique_ptr<Node> parseStatement();
    std::unique_ptr<Node> parseAssignment();
    std::unique_ptr<Node> parseCompoundStatement();
    void parseStatementList(Node& parent, TokenType terminator);
    std::unique_ptr<Node> parseRepeat();
    std::unique_ptr<Node> parseWhile();
    std::unique_ptr<Node> parseIf();
    std::unique_ptr<Node> parseBranch();
    std::unique_ptr<Node> parseWrite();
    std::unique_ptr<Node> parseWriteln();
    void parseWriteArguments(Node& node);

    // Expression parsing
    std::unique_ptr<Node> parseExpression();
    std::unique_ptr<Node> parseSimpleExpression();
    std::unique_ptr<Node> parseTerm();
    std::unique_ptr<Node> parseFactor();
    std::unique_ptr<Node> parseVariable();
    std::unique_ptr<Node> parseIntegerConstant();
    std::unique_ptr<Node> parseRealConstant();
    std::unique_ptr<Node> parseStringConstant();

    // Diagnostics and recovery
    void reportSyntaxError(const ParseError& error);
    void semanticError(const std::string& message, const Token& token);
    void synchronize();

    static bool isStatementStarter(TokenType type);
    static bool isStatementFollower(TokenType type);

    // State
    TokenSource& source_;
    symtab::Symtab& symtab_;
    std::ostream& diagnostics_;
    Token current_;
    int errorCount_ = 0;
};

} // namespace parser
} // namespace minipas

#endif // MINIPAS_PARSER_HPP
