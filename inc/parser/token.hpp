/**
 * Pascal Token Definitions
 *
 * Token types for the minipas teaching-language scanner.
 */

#pragma once

#include <string>
#include <cstdint>

namespace minipas {
namespace parser {

/**
 * Token types for Pascal parsing
 */
enum class TokenType {
    // Literals
    INTEGER,
    REAL,
    STRING,
    IDENTIFIER,

    // Keywords
    KW_PROGRAM,
    KW_BEGIN,
    KW_END,
    KW_REPEAT,
    KW_UNTIL,
    KW_WHILE,
    KW_DO,
    KW_IF,
    KW_THEN,
    KW_ELSE,
    KW_WRITE,
    KW_WRITELN,
    KW_DIV,
    KW_MOD,
    KW_AND,
    KW_OR,
    KW_NOT,

    // Operators
    PLUS,           // +
    MINUS,          // -
    STAR,           // *
    SLASH,          // /

    // Comparison
    EQ,             // =
    NE,             // <>
    LT,             // <
    LE,             // <=
    GT,             // >
    GE,             // >=

    // Assignment
    ASSIGN,         // :=

    // Delimiters
    LPAREN,         // (
    RPAREN,         // )
    SEMICOLON,      // ;
    COMMA,          // ,
    DOT,            // .
    COLON,          // :

    // Special
    END_OF_FILE,
    UNKNOWN
};

/**
 * Source location for error reporting
 */
struct SourceLocation {
    size_t line;
    size_t column;

    SourceLocation() : line(1), column(1) {}
    SourceLocation(size_t l, size_t c) : line(l), column(c) {}
};

/**
 * Token structure
 */
struct Token {
    TokenType type;
    std::string lexeme;      // Raw text, as written in the source
    SourceLocation location;

    // Type-specific values
    int64_t intValue;
    double floatValue;
    std::string stringValue; // Quotes removed, '' collapsed

    Token()
        : type(TokenType::UNKNOWN)
        , intValue(0)
        , floatValue(0.0)
    {}

    Token(TokenType t, const std::string& lex, SourceLocation loc)
        : type(t)
        , lexeme(lex)
        , location(loc)
        , intValue(0)
        , floatValue(0.0)
    {}

    bool isKeyword() const {
        return type >= TokenType::KW_PROGRAM && type <= TokenType::KW_NOT;
    }

    bool isRelational() const {
        return type >= TokenType::EQ && type <= TokenType::GE;
    }
};

/**
 * Convert token type to string (for error messages)
 */
const char* tokenTypeToString(TokenType type);

} // namespace parser
} // namespace minipas
