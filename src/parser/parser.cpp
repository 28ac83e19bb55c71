/**
 * Recursive Descent Parser Implementation
 */

#include "parser/parser.hpp"
#include <unordered_map>
#include <unordered_set>

namespace minipas {
namespace parser {

namespace {

// Operator tables, one per precedence level
const std::unordered_map<TokenType, NodeType> kRelationalOperators = {
    {TokenType::EQ, NodeType::EQ},
    {TokenType::LT, NodeType::LT},
    {TokenType::LE, NodeType::LE},
    {TokenType::GE, NodeType::GE},
    {TokenType::GT, NodeType::GT},
    {TokenType::NE, NodeType::NE},
};

const std::unordered_map<TokenType, NodeType> kSimpleExpressionOperators = {
    {TokenType::PLUS,  NodeType::ADD},
    {TokenType::MINUS, NodeType::SUBTRACT},
    {TokenType::KW_OR, NodeType::OR_OP},
};

// DIV shares the real-division node with '/'
const std::unordered_map<TokenType, NodeType> kTermOperators = {
    {TokenType::STAR,   NodeType::MULTIPLY},
    {TokenType::SLASH,  NodeType::DIVIDE},
    {TokenType::KW_DIV, NodeType::DIVIDE},
    {TokenType::KW_MOD, NodeType::MODULUS},
    {TokenType::KW_AND, NodeType::AND_OP},
};

std::unique_ptr<Node> makeOperator(NodeType type, const Token& op) {
    auto node = std::make_unique<Node>(type, op.location);
    node->text = op.lexeme;
    return node;
}

} // namespace

// ============================================================================
// Token Stream Management
// ============================================================================

Token PascalParser::consume() {
    Token previous = current_;
    current_ = source_.nextToken();
    return previous;
}

bool PascalParser::check(TokenType type) const {
    return current_.type == type;
}

bool PascalParser::match(TokenType type) {
    if (check(type)) {
        consume();
        return true;
    }
    return false;
}

void PascalParser::expect(TokenType type, const std::string& message) {
    if (!check(type)) {
        throw ParseError(message, current_);
    }
    consume();
}

bool PascalParser::isStatementStarter(TokenType type) {
    static const std::unordered_set<TokenType> starters = {
        TokenType::KW_BEGIN, TokenType::IDENTIFIER, TokenType::KW_REPEAT,
        TokenType::KW_WHILE, TokenType::KW_IF, TokenType::KW_WRITE,
        TokenType::KW_WRITELN,
    };
    return starters.count(type) != 0;
}

bool PascalParser::isStatementFollower(TokenType type) {
    static const std::unordered_set<TokenType> followers = {
        TokenType::SEMICOLON, TokenType::KW_END, TokenType::KW_UNTIL,
        TokenType::END_OF_FILE,
    };
    return followers.count(type) != 0;
}

// ============================================================================
// Diagnostics
// ============================================================================

void PascalParser::reportSyntaxError(const ParseError& error) {
    diagnostics_ << error.what() << std::endl;
    ++errorCount_;
}

void PascalParser::semanticError(const std::string& message, const Token& token) {
    diagnostics_ << "SEMANTIC ERROR at line " << token.location.line
                 << ": " << message << " at '" << token.lexeme << "'" << std::endl;
    ++errorCount_;
}

void PascalParser::synchronize() {
    while (!isStatementFollower(current_.type)) {
        consume();
    }
}

// ============================================================================
// Entry Point
// ============================================================================

std::unique_ptr<Node> PascalParser::parseProgram() {
    current_ = source_.nextToken();  // first token

    auto program = std::make_unique<Node>(NodeType::PROGRAM, current_.location);

    // Header problems are reported in place; the body is still parsed
    if (!match(TokenType::KW_PROGRAM)) {
        reportSyntaxError(ParseError("Expecting PROGRAM", current_));
    }

    if (check(TokenType::IDENTIFIER)) {
        Token name = consume();
        symtab_.enter(name.lexeme);
        program->text = name.lexeme;
    } else {
        reportSyntaxError(ParseError("Expecting program name", current_));
    }

    if (!match(TokenType::SEMICOLON)) {
        reportSyntaxError(ParseError("Missing ;", current_));
    }

    try {
        if (!check(TokenType::KW_BEGIN)) {
            throw ParseError("Expecting BEGIN", current_);
        }
        program->adopt(parseCompoundStatement());
    } catch (const ParseError& e) {
        reportSyntaxError(e);
        program->adopt(std::make_unique<Node>(NodeType::COMPOUND, e.token.location));
    }

    if (!check(TokenType::DOT)) {
        reportSyntaxError(ParseError("Expecting .", current_));
    }

    return program;
}

// ============================================================================
// Statement Parsing
// ============================================================================

std::unique_ptr<Node> PascalParser::parseStatement() {
    switch (current_.type) {
        case TokenType::IDENTIFIER:  return parseAssignment();
        case TokenType::KW_BEGIN:    return parseCompoundStatement();
        case TokenType::KW_REPEAT:   return parseRepeat();
        case TokenType::KW_WHILE:    return parseWhile();
        case TokenType::KW_IF:       return parseIf();
        case TokenType::KW_WRITE:    return parseWrite();
        case TokenType::KW_WRITELN:  return parseWriteln();

        // Empty statement
        case TokenType::SEMICOLON:
        case TokenType::KW_END:
        case TokenType::KW_UNTIL:
            return nullptr;

        default:
            throw ParseError("Unexpected token", current_);
    }
}

std::unique_ptr<Node> PascalParser::parseAssignment() {
    Token target = consume();

    auto assign = std::make_unique<Node>(NodeType::ASSIGN, target.location);

    // First assignment declares the variable
    if (!symtab_.lookup(target.lexeme)) {
        symtab_.enter(target.lexeme);
    }

    auto lhs = std::make_unique<Node>(NodeType::VARIABLE, target.location);
    lhs->text = target.lexeme;
    assign->adopt(std::move(lhs));

    expect(TokenType::ASSIGN, "Missing :=");
    assign->adopt(parseExpression());

    return assign;
}

std::unique_ptr<Node> PascalParser::parseCompoundStatement() {
    auto compound = std::make_unique<Node>(NodeType::COMPOUND, current_.location);

    expect(TokenType::KW_BEGIN, "Expecting BEGIN");
    parseStatementList(*compound, TokenType::KW_END);
    expect(TokenType::KW_END, "Expecting END");

    return compound;
}

void PascalParser::parseStatementList(Node& parent, TokenType terminator) {
    while (!check(terminator) && !check(TokenType::END_OF_FILE)) {
        // A stray END or UNTIL closes the list; the caller reports it
        if (check(TokenType::KW_END) || check(TokenType::KW_UNTIL)) {
            break;
        }

        try {
            auto stmt = parseStatement();
            if (stmt) parent.adopt(std::move(stmt));
        } catch (const ParseError& e) {
            reportSyntaxError(e);
            synchronize();
        }

        // A semicolon separates statements
        if (check(TokenType::SEMICOLON)) {
            while (match(TokenType::SEMICOLON)) {}
        }
        else if (isStatementStarter(current_.type)) {
            reportSyntaxError(ParseError("Missing ;", current_));
        }
    }
}

std::unique_ptr<Node> PascalParser::parseRepeat() {
    Token keyword = consume();  // REPEAT
    auto loop = std::make_unique<Node>(NodeType::LOOP, keyword.location);

    parseStatementList(*loop, TokenType::KW_UNTIL);

    if (!check(TokenType::KW_UNTIL)) {
        throw ParseError("Expecting UNTIL", current_);
    }
    Token until = consume();

    // Post-test: the TEST is the loop's last child
    auto test = std::make_unique<Node>(NodeType::TEST, until.location);
    test->adopt(parseExpression());
    loop->adopt(std::move(test));

    return loop;
}

std::unique_ptr<Node> PascalParser::parseWhile() {
    Token keyword = consume();  // WHILE
    auto loop = std::make_unique<Node>(NodeType::LOOP, keyword.location);

    // Pre-test: the loop exits when NOT condition holds, checked first
    auto test = std::make_unique<Node>(NodeType::TEST, current_.location);
    auto notNode = std::make_unique<Node>(NodeType::NOT_OP, current_.location);
    notNode->adopt(parseExpression());
    test->adopt(std::move(notNode));
    loop->adopt(std::move(test));

    expect(TokenType::KW_DO, "Expecting DO");
    expect(TokenType::KW_BEGIN, "Expecting BEGIN");
    parseStatementList(*loop, TokenType::KW_END);
    expect(TokenType::KW_END, "Expecting END");

    return loop;
}

std::unique_ptr<Node> PascalParser::parseIf() {
    Token keyword = consume();  // IF
    auto ifNode = std::make_unique<Node>(NodeType::IF_STATEMENT, keyword.location);

    auto test = std::make_unique<Node>(NodeType::TEST, current_.location);
    test->adopt(parseExpression());
    ifNode->adopt(std::move(test));

    expect(TokenType::KW_THEN, "Expecting THEN");
    ifNode->adopt(parseBranch());

    if (match(TokenType::KW_ELSE)) {
        ifNode->adopt(parseBranch());
    }

    return ifNode;
}

std::unique_ptr<Node> PascalParser::parseBranch() {
    std::unique_ptr<Node> branch;
    if (!check(TokenType::KW_ELSE)) {
        branch = parseStatement();
    }

    // An empty branch still occupies its slot
    if (!branch) {
        branch = std::make_unique<Node>(NodeType::COMPOUND, current_.location);
    }
    return branch;
}

std::unique_ptr<Node> PascalParser::parseWrite() {
    Token keyword = consume();  // WRITE
    auto write = std::make_unique<Node>(NodeType::WRITE, keyword.location);

    parseWriteArguments(*write);
    return write;
}

std::unique_ptr<Node> PascalParser::parseWriteln() {
    Token keyword = consume();  // WRITELN
    auto writeln = std::make_unique<Node>(NodeType::WRITELN, keyword.location);

    if (check(TokenType::LPAREN)) {
        parseWriteArguments(*writeln);
    }
    return writeln;
}

void PascalParser::parseWriteArguments(Node& node) {
    expect(TokenType::LPAREN, "Missing left parenthesis");

    if (check(TokenType::IDENTIFIER)) {
        node.adopt(parseVariable());
    } else if (check(TokenType::STRING)) {
        node.adopt(parseStringConstant());
    } else {
        throw ParseError("Invalid WRITE or WRITELN statement", current_);
    }

    // Optional field width and count of decimal places
    if (match(TokenType::COLON)) {
        if (!check(TokenType::INTEGER)) {
            throw ParseError("Invalid field width", current_);
        }
        node.adopt(parseIntegerConstant());

        if (match(TokenType::COLON)) {
            if (!check(TokenType::INTEGER)) {
                throw ParseError("Invalid count of decimal places", current_);
            }
            node.adopt(parseIntegerConstant());
        }
    }

    expect(TokenType::RPAREN, "Missing right parenthesis");
}

// ============================================================================
// Expression Parsing
// ============================================================================

std::unique_ptr<Node> PascalParser::parseExpression() {
    auto expr = parseSimpleExpression();

    auto it = kRelationalOperators.find(current_.type);
    if (it != kRelationalOperators.end()) {
        auto opNode = makeOperator(it->second, consume());
        opNode->adopt(std::move(expr));
        opNode->adopt(parseSimpleExpression());
        expr = std::move(opNode);
    }

    return expr;
}

std::unique_ptr<Node> PascalParser::parseSimpleExpression() {
    std::unique_ptr<Node> expr;

    // Leading sign applies to the first term only
    if (check(TokenType::PLUS) || check(TokenType::MINUS)) {
        Token sign = consume();
        expr = makeOperator(sign.type == TokenType::PLUS ? NodeType::POSITIVE
                                                         : NodeType::NEGATE, sign);
        expr->adopt(parseTerm());
    } else {
        expr = parseTerm();
    }

    for (auto it = kSimpleExpressionOperators.find(current_.type);
         it != kSimpleExpressionOperators.end();
         it = kSimpleExpressionOperators.find(current_.type)) {
        auto opNode = makeOperator(it->second, consume());
        opNode->adopt(std::move(expr));
        opNode->adopt(parseTerm());
        expr = std::move(opNode);
    }

    return expr;
}

std::unique_ptr<Node> PascalParser::parseTerm() {
    auto term = parseFactor();

    for (auto it = kTermOperators.find(current_.type);
         it != kTermOperators.end();
         it = kTermOperators.find(current_.type)) {
        auto opNode = makeOperator(it->second, consume());
        opNode->adopt(std::move(term));
        opNode->adopt(parseFactor());
        term = std::move(opNode);
    }

    return term;
}

std::unique_ptr<Node> PascalParser::parseFactor() {
    switch (current_.type) {
        case TokenType::IDENTIFIER: return parseVariable();
        case TokenType::INTEGER:    return parseIntegerConstant();
        case TokenType::REAL:       return parseRealConstant();

        case TokenType::LPAREN: {
            consume();
            auto expr = parseExpression();
            expect(TokenType::RPAREN, "Expecting )");
            return expr;
        }

        case TokenType::KW_NOT: {
            auto notNode = makeOperator(NodeType::NOT_OP, consume());
            notNode->adopt(parseExpression());
            return notNode;
        }

        default:
            throw ParseError("Unexpected token", current_);
    }
}

std::unique_ptr<Node> PascalParser::parseVariable() {
    Token name = consume();

    if (!symtab_.lookup(name.lexeme)) {
        semanticError("Undeclared identifier", name);
    }

    auto node = std::make_unique<Node>(NodeType::VARIABLE, name.location);
    node->text = name.lexeme;
    return node;
}

std::unique_ptr<Node> PascalParser::parseIntegerConstant() {
    Token number = consume();
    auto node = std::make_unique<Node>(NodeType::INTEGER_CONSTANT, number.location);
    node->text = number.lexeme;
    node->value = number.intValue;
    return node;
}

std::unique_ptr<Node> PascalParser::parseRealConstant() {
    Token number = consume();
    auto node = std::make_unique<Node>(NodeType::REAL_CONSTANT, number.location);
    node->text = number.lexeme;
    node->value = number.floatValue;
    return node;
}

std::unique_ptr<Node> PascalParser::parseStringConstant() {
    Token str = consume();
    auto node = std::make_unique<Node>(NodeType::STRING_CONSTANT, str.location);
    node->text = str.lexeme;
    node->value = str.stringValue;
    return node;
}

} // namespace parser
} // namespace minipas
