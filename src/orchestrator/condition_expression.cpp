#include "orchestrator/condition_expression.hpp"
#include "orchestrator/pipeline_errors.hpp"

#include <algorithm>
#include <cctype>

namespace DPF {
namespace Orchestrator {

namespace {

enum class TokenType {
    IDENTIFIER,
    STRING,
    NUMBER,
    TRUE_LITERAL,
    FALSE_LITERAL,
    AND,
    OR,
    NOT,
    EQUAL,
    NOT_EQUAL,
    LPAREN,
    RPAREN,
    END
};

struct Token {
    TokenType type;
    std::string text;
    size_t position;
};

bool isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

// EN: Recursive-descent parser producing the node arena of a ConditionExpression.
// FR: Parseur descendant récursif produisant l'arène de nœuds d'une ConditionExpression.
class ConditionExpression::Parser {
public:
    Parser(const std::string& text, ConditionExpression& target) : text_(text), target_(target) {}

    size_t parseAll() {
        tokenize();
        size_t root = parseOr();
        if (peek().type != TokenType::END) {
            error("unexpected '" + peek().text + "'", peek().position);
        }
        return root;
    }

private:
    void tokenize() {
        size_t i = 0;
        while (i < text_.size()) {
            char c = text_[i];
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++i;
                continue;
            }

            size_t start = i;
            if (c == '\'' || c == '"') {
                std::string value;
                ++i;
                while (i < text_.size() && text_[i] != c) {
                    if (text_[i] == '\\' && i + 1 < text_.size()) {
                        ++i;
                    }
                    value += text_[i++];
                }
                if (i >= text_.size()) {
                    error("unterminated string literal", start);
                }
                ++i;
                tokens_.push_back({TokenType::STRING, value, start});
            } else if (isIdentifierStart(c)) {
                while (i < text_.size() && isIdentifierChar(text_[i])) {
                    ++i;
                }
                std::string word = text_.substr(start, i - start);
                TokenType type = word == "true" ? TokenType::TRUE_LITERAL
                               : word == "false" ? TokenType::FALSE_LITERAL
                               : TokenType::IDENTIFIER;
                tokens_.push_back({type, word, start});
            } else if (std::isdigit(static_cast<unsigned char>(c))) {
                while (i < text_.size() && (std::isdigit(static_cast<unsigned char>(text_[i])) || text_[i] == '.')) {
                    ++i;
                }
                tokens_.push_back({TokenType::NUMBER, text_.substr(start, i - start), start});
            } else if (text_.compare(i, 2, "&&") == 0) {
                tokens_.push_back({TokenType::AND, "&&", start});
                i += 2;
            } else if (text_.compare(i, 2, "||") == 0) {
                tokens_.push_back({TokenType::OR, "||", start});
                i += 2;
            } else if (text_.compare(i, 2, "==") == 0) {
                tokens_.push_back({TokenType::EQUAL, "==", start});
                i += 2;
            } else if (text_.compare(i, 2, "!=") == 0) {
                tokens_.push_back({TokenType::NOT_EQUAL, "!=", start});
                i += 2;
            } else if (c == '!') {
                tokens_.push_back({TokenType::NOT, "!", start});
                ++i;
            } else if (c == '(') {
                tokens_.push_back({TokenType::LPAREN, "(", start});
                ++i;
            } else if (c == ')') {
                tokens_.push_back({TokenType::RPAREN, ")", start});
                ++i;
            } else {
                error(std::string("unexpected character '") + c + "'", start);
            }
        }
        tokens_.push_back({TokenType::END, "end of expression", text_.size()});
    }

    const Token& peek() const { return tokens_[pos_]; }
    const Token& advance() { return tokens_[pos_++]; }

    size_t addNode(NodeKind kind, std::string text, std::vector<size_t> children = {}) {
        target_.nodes_.push_back(Node{kind, std::move(text), std::move(children)});
        return target_.nodes_.size() - 1;
    }

    size_t parseOr() {
        size_t left = parseAnd();
        while (peek().type == TokenType::OR) {
            advance();
            size_t right = parseAnd();
            left = addNode(NodeKind::OR, "||", {left, right});
        }
        return left;
    }

    size_t parseAnd() {
        size_t left = parseUnary();
        while (peek().type == TokenType::AND) {
            advance();
            size_t right = parseUnary();
            left = addNode(NodeKind::AND, "&&", {left, right});
        }
        return left;
    }

    size_t parseUnary() {
        if (peek().type == TokenType::NOT) {
            advance();
            size_t operand = parseUnary();
            return addNode(NodeKind::NOT, "!", {operand});
        }
        return parsePrimary();
    }

    size_t parsePrimary() {
        if (peek().type == TokenType::LPAREN) {
            const Token& open = advance();
            size_t inner = parseOr();
            if (peek().type != TokenType::RPAREN) {
                error("missing ')' for '(' at position " + std::to_string(open.position + 1), peek().position);
            }
            advance();
            return inner;
        }

        size_t left = parseOperand();
        if (peek().type == TokenType::EQUAL || peek().type == TokenType::NOT_EQUAL) {
            NodeKind kind = advance().type == TokenType::EQUAL ? NodeKind::EQUAL : NodeKind::NOT_EQUAL;
            size_t right = parseOperand();
            return addNode(kind, kind == NodeKind::EQUAL ? "==" : "!=", {left, right});
        }
        return left;
    }

    size_t parseOperand() {
        const Token& token = peek();
        switch (token.type) {
            case TokenType::IDENTIFIER:
                advance();
                return addNode(NodeKind::IDENTIFIER, token.text);
            case TokenType::STRING:
            case TokenType::NUMBER:
            case TokenType::TRUE_LITERAL:
            case TokenType::FALSE_LITERAL:
                advance();
                return addNode(NodeKind::LITERAL, token.text);
            default:
                error("expected a value but found '" + token.text + "'", token.position);
        }
        return 0;
    }

    [[noreturn]] void error(const std::string& message, size_t position) const {
        throw DefinitionError("invalid condition '" + text_ + "': " + message +
                              " at position " + std::to_string(position + 1));
    }

    const std::string& text_;
    ConditionExpression& target_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

ConditionExpression ConditionExpression::parse(const std::string& source) {
    ConditionExpression expression;
    expression.source_ = trim(source);

    // EN: Accept the `${{ expr }}` wrapper used by workflow files.
    // FR: Accepte l'enveloppe `${{ expr }}` des fichiers de workflow.
    std::string body = expression.source_;
    if (body.size() >= 5 && body.compare(0, 3, "${{") == 0 && body.compare(body.size() - 2, 2, "}}") == 0) {
        body = trim(body.substr(3, body.size() - 5));
    }

    if (body.empty()) {
        throw DefinitionError("invalid condition: expression is empty");
    }

    Parser parser(body, expression);
    expression.root_ = parser.parseAll();
    return expression;
}

bool ConditionExpression::evaluate(const RunParameters& parameters) const {
    return evaluateNode(root_, parameters);
}

bool ConditionExpression::evaluateNode(size_t index, const RunParameters& parameters) const {
    const Node& node = nodes_[index];
    switch (node.kind) {
        case NodeKind::OR:
            return evaluateNode(node.children[0], parameters) || evaluateNode(node.children[1], parameters);
        case NodeKind::AND:
            return evaluateNode(node.children[0], parameters) && evaluateNode(node.children[1], parameters);
        case NodeKind::NOT:
            return !evaluateNode(node.children[0], parameters);
        case NodeKind::EQUAL:
            return operandValue(node.children[0], parameters) == operandValue(node.children[1], parameters);
        case NodeKind::NOT_EQUAL:
            return operandValue(node.children[0], parameters) != operandValue(node.children[1], parameters);
        case NodeKind::IDENTIFIER:
        case NodeKind::LITERAL:
            return isTruthy(operandValue(index, parameters));
    }
    return false;
}

std::string ConditionExpression::operandValue(size_t index, const RunParameters& parameters) const {
    const Node& node = nodes_[index];
    if (node.kind == NodeKind::LITERAL) {
        return node.text;
    }

    auto it = parameters.find(node.text);
    if (it != parameters.end()) {
        return it->second;
    }

    static const std::string kInputsPrefix = "inputs.";
    if (node.text.compare(0, kInputsPrefix.size(), kInputsPrefix) == 0) {
        it = parameters.find(node.text.substr(kInputsPrefix.size()));
        if (it != parameters.end()) {
            return it->second;
        }
    }
    return "";
}

std::vector<std::string> ConditionExpression::referencedIdentifiers() const {
    // EN: Nodes are appended in source order, so a linear scan preserves appearance order.
    // FR: Les nœuds sont ajoutés dans l'ordre source, un parcours linéaire préserve l'ordre.
    std::vector<std::string> names;
    for (const auto& node : nodes_) {
        if (node.kind == NodeKind::IDENTIFIER &&
            std::find(names.begin(), names.end(), node.text) == names.end()) {
            names.push_back(node.text);
        }
    }
    return names;
}

bool ConditionExpression::isTruthy(const std::string& value) {
    return !value.empty() && value != "false" && value != "0";
}

} // namespace Orchestrator
} // namespace DPF
