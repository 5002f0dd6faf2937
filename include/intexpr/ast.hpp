#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "intexpr/token.hpp"

namespace intexpr {

struct Node;
using NodePtr = std::unique_ptr<Node>;

enum class BinaryOperator : char { Add = '+', Sub = '-', Mul = '*', Div = '/' };
enum class UnaryOperator : char { Plus = '+', Minus = '-' };

struct IntegerLiteral {
    Number value{0};
};

struct BinaryOp {
    BinaryOperator op{BinaryOperator::Add};
    NodePtr left;
    NodePtr right;
};

struct UnaryOp {
    UnaryOperator op{UnaryOperator::Minus};
    NodePtr operand;
};

struct FunctionCall {
    std::string name;
    std::vector<NodePtr> args;
};

/// A node owns its children exclusively; trees are never shared.
struct Node {
    using Variant = std::variant<IntegerLiteral, BinaryOp, UnaryOp, FunctionCall>;

    Variant v;

    template <class T>
    bool is() const { return std::holds_alternative<T>(v); }

    template <class T>
    const T& as() const { return std::get<T>(v); }
};

NodePtr make_integer(Number value);
NodePtr make_binary(BinaryOperator op, NodePtr left, NodePtr right);
NodePtr make_unary(UnaryOperator op, NodePtr operand);
NodePtr make_call(std::string name, std::vector<NodePtr> args);

// Deep structural equality.
bool operator==(const Node& a, const Node& b);
bool operator!=(const Node& a, const Node& b);

// Prefix dump: (+ 2 (* 3 4)), (neg 5), (pos 5), (call max 1 2)
std::string to_string(const Node& n);

} // namespace intexpr
