#include "intexpr/parser.hpp"
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace intexpr {

static constexpr std::uint64_t kMaxLiteral = static_cast<std::uint64_t>(std::numeric_limits<Number>::max());

Status Parser::advance() {
    Result<Token> t = lex_.next();
    if (!t) return std::move(t).error();
    cur_ = std::move(t).value();
    return std::nullopt;
}

Status Parser::expect(TokKind kind) {
    if (cur_.kind != kind) {
        return parse_error(std::string("Expected ") + to_string(kind) + ", got " + to_string(cur_.kind),
                           cur_.offset);
    }
    return advance();
}

Result<NodePtr> Parser::parse() {
    lex_ = Lexer(input_);
    if (auto err = advance()) return std::move(*err);

    Result<NodePtr> root = parse_expression();
    if (!root) return root;
    if (auto err = expect(TokKind::End)) return std::move(*err);
    return root;
}

Result<NodePtr> Parser::parse_expression() {
    Result<NodePtr> node = parse_term();
    if (!node) return node;

    while (cur_.kind == TokKind::Plus || cur_.kind == TokKind::Minus) {
        BinaryOperator op = cur_.kind == TokKind::Plus ? BinaryOperator::Add : BinaryOperator::Sub;
        if (auto err = advance()) return std::move(*err);
        Result<NodePtr> rhs = parse_term();
        if (!rhs) return rhs;
        node = make_binary(op, std::move(node).value(), std::move(rhs).value());
    }
    return node;
}

Result<NodePtr> Parser::parse_term() {
    Result<NodePtr> node = parse_factor();
    if (!node) return node;

    while (cur_.kind == TokKind::Star || cur_.kind == TokKind::Slash) {
        BinaryOperator op = cur_.kind == TokKind::Star ? BinaryOperator::Mul : BinaryOperator::Div;
        if (auto err = advance()) return std::move(*err);
        Result<NodePtr> rhs = parse_factor();
        if (!rhs) return rhs;
        node = make_binary(op, std::move(node).value(), std::move(rhs).value());
    }
    return node;
}

Result<NodePtr> Parser::parse_factor() {
    switch (cur_.kind) {
        case TokKind::Plus:
        case TokKind::Minus: {
            UnaryOperator op = cur_.kind == TokKind::Plus ? UnaryOperator::Plus : UnaryOperator::Minus;
            if (auto err = advance()) return std::move(*err);
            // -9223372036854775808 has no positive counterpart; fold it here
            if (op == UnaryOperator::Minus && cur_.kind == TokKind::Integer && cur_.value == kMaxLiteral + 1) {
                if (auto err = advance()) return std::move(*err);
                return make_integer(std::numeric_limits<Number>::min());
            }
            Result<NodePtr> operand = parse_factor();
            if (!operand) return operand;
            return make_unary(op, std::move(operand).value());
        }

        case TokKind::Integer: {
            if (cur_.value > kMaxLiteral) return lex_error("Integer literal out of range", cur_.offset);
            Number v = static_cast<Number>(cur_.value);
            if (auto err = advance()) return std::move(*err);
            return make_integer(v);
        }

        case TokKind::Ident: {
            Token name = cur_;
            if (auto err = advance()) return std::move(*err);
            if (cur_.kind != TokKind::LParen) {
                return parse_error("Unexpected identifier '" + name.text + "' (variables are not supported)",
                                   name.offset);
            }
            return parse_call(std::move(name.text));
        }

        case TokKind::LParen: {
            if (auto err = advance()) return std::move(*err);
            Result<NodePtr> inner = parse_expression();
            if (!inner) return inner;
            if (auto err = expect(TokKind::RParen)) return std::move(*err);
            return inner;
        }

        default:
            break;
    }
    return parse_error(std::string("Expected expression, got ") + to_string(cur_.kind), cur_.offset);
}

// Current token is the '(' after the function name.
Result<NodePtr> Parser::parse_call(std::string name) {
    if (auto err = expect(TokKind::LParen)) return std::move(*err);

    std::vector<NodePtr> args;
    if (cur_.kind != TokKind::RParen) {
        for (;;) {
            Result<NodePtr> arg = parse_expression();
            if (!arg) return arg;
            args.push_back(std::move(arg).value());
            if (cur_.kind != TokKind::Comma) break;
            if (auto err = advance()) return std::move(*err);
        }
    }
    if (auto err = expect(TokKind::RParen)) return std::move(*err);
    return make_call(std::move(name), std::move(args));
}

} // namespace intexpr
