/**
 * Pascal Lexer Implementation
 */

#include "parser/lexer.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace minipas {
namespace parser {

// =============================================================================
// Token Type Strings
// =============================================================================

const char* tokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::INTEGER: return "INTEGER";
        case TokenType::REAL: return "REAL";
        case TokenType::STRING: return "STRING";
        case TokenType::IDENTIFIER: return "IDENTIFIER";

        case TokenType::KW_PROGRAM: return "PROGRAM";
        case TokenType::KW_BEGIN: return "BEGIN";
        case TokenType::KW_END: return "END";
        case TokenType::KW_REPEAT: return "REPEAT";
        case TokenType::KW_UNTIL: return "UNTIL";
        case TokenType::KW_WHILE: return "WHILE";
        case TokenType::KW_DO: return "DO";
        case TokenType::KW_IF: return "IF";
        case TokenType::KW_THEN: return "THEN";
        case TokenType::KW_ELSE: return "ELSE";
        case TokenType::KW_WRITE: return "WRITE";
        case TokenType::KW_WRITELN: return "WRITELN";
        case TokenType::KW_DIV: return "DIV";
        case TokenType::KW_MOD: return "MOD";
        case TokenType::KW_AND: return "AND";
        case TokenType::KW_OR: return "OR";
        case TokenType::KW_NOT: return "NOT";

        case TokenType::PLUS: return "+";
        case TokenType::MINUS: return "-";
        case TokenType::STAR: return "*";
        case TokenType::SLASH: return "/";
        case TokenType::EQ: return "=";
        case TokenType::NE: return "<>";
        case TokenType::LT: return "<";
        case TokenType::LE: return "<=";
        case TokenType::GT: return ">";
        case TokenType::GE: return ">=";
        case TokenType::ASSIGN: return ":=";

        case TokenType::LPAREN: return "(";
        case TokenType::RPAREN: return ")";
        case TokenType::SEMICOLON: return ";";
        case TokenType::COMMA: return ",";
        case TokenType::DOT: return ".";
        case TokenType::COLON: return ":";

        case TokenType::END_OF_FILE: return "EOF";
        case TokenType::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

// =============================================================================
// PascalLexer Implementation
// =============================================================================

PascalLexer::PascalLexer(const std::string& source)
    : source_(source)
    , current_(0)
    , line_(1)
    , column_(1)
{}

TokenType PascalLexer::identifierType(const std::string& text) {
    static const std::unordered_map<std::string, TokenType> keywords = {
        {"program", TokenType::KW_PROGRAM},
        {"begin",   TokenType::KW_BEGIN},
        {"end",     TokenType::KW_END},
        {"repeat",  TokenType::KW_REPEAT},
        {"until",   TokenType::KW_UNTIL},
        {"while",   TokenType::KW_WHILE},
        {"do",      TokenType::KW_DO},
        {"if",      TokenType::KW_IF},
        {"then",    TokenType::KW_THEN},
        {"else",    TokenType::KW_ELSE},
        {"write",   TokenType::KW_WRITE},
        {"writeln", TokenType::KW_WRITELN},
        {"div",     TokenType::KW_DIV},
        {"mod",     TokenType::KW_MOD},
        {"and",     TokenType::KW_AND},
        {"or",      TokenType::KW_OR},
        {"not",     TokenType::KW_NOT},
    };

    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = keywords.find(lower);
    if (it != keywords.end()) {
        return it->second;
    }
    return TokenType::IDENTIFIER;
}

std::vector<Token> PascalLexer::tokenize() {
    std::vector<Token> tokens;

    while (true) {
        Token token = nextToken();
        tokens.push_back(token);

        if (token.type == TokenType::END_OF_FILE) {
            break;
        }
    }

    return tokens;
}

Token PascalLexer::nextToken() {
    skipWhitespaceAndComments();

    if (isAtEnd()) {
        return makeToken(TokenType::END_OF_FILE, "", currentLocation());
    }

    char c = peek();

    // String literals
    if (c == '\'') {
        return scanString();
    }

    // Numbers
    if (std::isdigit(static_cast<unsigned char>(c))) {
        return scanNumber();
    }

    // Identifiers and keywords
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        return scanIdentifier();
    }

    // Operators and delimiters
    return scanOperator();
}

char PascalLexer::peek() const {
    if (isAtEnd()) return '\0';
    return source_[current_];
}

char PascalLexer::peekNext() const {
    if (current_ + 1 >= source_.length()) return '\0';
    return source_[current_ + 1];
}

char PascalLexer::advance() {
    char c = source_[current_++];

    if (c == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }

    return c;
}

bool PascalLexer::match(char expected) {
    if (isAtEnd()) return false;
    if (source_[current_] != expected) return false;

    advance();
    return true;
}

Token PascalLexer::makeToken(TokenType type, const std::string& lexeme, SourceLocation loc) {
    return Token(type, lexeme, loc);
}

SourceLocation PascalLexer::currentLocation() const {
    return SourceLocation(line_, column_);
}

void PascalLexer::skipWhitespaceAndComments() {
    while (!isAtEnd()) {
        char c = peek();

        if (isWhitespace(c)) {
            advance();
        }
        else if (c == '{') {
            // { comment }, unterminated runs to end of input
            while (!isAtEnd() && peek() != '}') advance();
            if (!isAtEnd()) advance();
        }
        else if (c == '(' && peekNext() == '*') {
            advance();
            advance();
            while (!isAtEnd() && !(peek() == '*' && peekNext() == ')')) advance();
            if (!isAtEnd()) {
                advance();
                advance();
            }
        }
        else {
            break;
        }
    }
}

bool PascalLexer::isWhitespace(char c) const {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
}

Token PascalLexer::scanString() {
    SourceLocation loc = currentLocation();
    size_t start = current_;
    advance();  // Consume opening quote

    std::string value;
    bool closed = false;

    // Strings may not span lines
    while (!isAtEnd() && peek() != '\n') {
        char c = advance();

        if (c == '\'') {
            if (peek() == '\'') {
                advance();
                value += '\'';
                continue;
            }
            closed = true;
            break;
        }
        value += c;
    }

    std::string lexeme = source_.substr(start, current_ - start);
    if (!closed) {
        return makeToken(TokenType::UNKNOWN, lexeme, loc);
    }

    Token token(TokenType::STRING, lexeme, loc);
    token.stringValue = value;
    return token;
}

Token PascalLexer::scanNumber() {
    SourceLocation loc = currentLocation();
    std::string value;
    bool isReal = false;

    while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
        value += advance();
    }

    // Fraction: a '.' not followed by a digit is left for the parser
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peekNext()))) {
        isReal = true;
        value += advance();  // Consume '.'

        while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
            value += advance();
        }
    }

    // Exponent
    if (peek() == 'e' || peek() == 'E') {
        size_t sign = (peekNext() == '+' || peekNext() == '-') ? 1 : 0;
        size_t digitAt = current_ + 1 + sign;
        if (digitAt < source_.length() &&
            std::isdigit(static_cast<unsigned char>(source_[digitAt]))) {
            isReal = true;
            value += advance();
            if (sign) value += advance();
            while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
                value += advance();
            }
        }
    }

    try {
        if (isReal) {
            Token token(TokenType::REAL, value, loc);
            token.floatValue = std::stod(value);
            return token;
        }

        Token token(TokenType::INTEGER, value, loc);
        token.intValue = std::stoll(value);
        return token;
    } catch (const std::out_of_range&) {
        // Literal does not fit; the parser reports it as an unexpected token
        return makeToken(TokenType::UNKNOWN, value, loc);
    }
}

Token PascalLexer::scanIdentifier() {
    SourceLocation loc = currentLocation();
    std::string value;

    while (!isAtEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
        value += advance();
    }

    return Token(identifierType(value), value, loc);
}

Token PascalLexer::scanOperator() {
    SourceLocation loc = currentLocation();
    char c = advance();

    switch (c) {
        case '+': return makeToken(TokenType::PLUS, "+", loc);
        case '-': return makeToken(TokenType::MINUS, "-", loc);
        case '*': return makeToken(TokenType::STAR, "*", loc);
        case '/': return makeToken(TokenType::SLASH, "/", loc);
        case '=': return makeToken(TokenType::EQ, "=", loc);

        case '<':
            if (match('=')) return makeToken(TokenType::LE, "<=", loc);
            if (match('>')) return makeToken(TokenType::NE, "<>", loc);
            return makeToken(TokenType::LT, "<", loc);

        case '>':
            if (match('=')) return makeToken(TokenType::GE, ">=", loc);
            return makeToken(TokenType::GT, ">", loc);

        case ':':
            if (match('=')) return makeToken(TokenType::ASSIGN, ":=", loc);
            return makeToken(TokenType::COLON, ":", loc);

        case '(': return makeToken(TokenType::LPAREN, "(", loc);
        case ')': return makeToken(TokenType::RPAREN, ")", loc);
        case ';': return makeToken(TokenType::SEMICOLON, ";", loc);
        case ',': return makeToken(TokenType::COMMA, ",", loc);
        case '.': return makeToken(TokenType::DOT, ".", loc);

        default:
            return makeToken(TokenType::UNKNOWN, std::string(1, c), loc);
    }
}

} // namespace parser
} // namespace minipas
