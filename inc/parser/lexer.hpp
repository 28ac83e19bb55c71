/**
 * Pascal Lexer - Case-Insensitive Tokenization
 *
 * Converts program text into a token stream with support for:
 * - Case-insensitive reserved words
 * - Quoted strings with '' escapes
 * - { ... } and (* ... *) comments
 */

#pragma once

#include "parser/token.hpp"
#include <vector>
#include <string>
#include <unordered_map>

namespace minipas {
namespace parser {

/**
 * Anything the parser can pull tokens from.
 *
 * Once the input is exhausted, nextToken() keeps returning END_OF_FILE.
 */
class TokenSource {
public:
    virtual ~TokenSource() = default;
    virtual Token nextToken() = 0;
};

/**
 * Pascal Lexer - Tokenizes source code
 */
class PascalLexer : public TokenSource {
public:
    explicit PascalLexer(const std::string& source);

    /**
     * Tokenize entire source (always ends with END_OF_FILE)
     */
    std::vector<Token> tokenize();

    /**
     * Get next token
     */
    Token nextToken() override;

    /**
     * Check if at end of input
     */
    bool isAtEnd() const { return current_ >= source_.length(); }

private:
    std::string source_;
    size_t current_;
    size_t line_;
    size_t column_;

    // Character access
    char peek() const;
    char peekNext() const;
    char advance();
    bool match(char expected);

    // Token creation
    Token makeToken(TokenType type, const std::string& lexeme, SourceLocation loc);
    SourceLocation currentLocation() const;

    // Whitespace and comment handling
    void skipWhitespaceAndComments();
    bool isWhitespace(char c) const;

    // Token scanning
    Token scanString();
    Token scanNumber();
    Token scanIdentifier();
    Token scanOperator();

    // Keyword lookup
    static TokenType identifierType(const std::string& text);
};

} // namespace parser
} // namespace minipas
