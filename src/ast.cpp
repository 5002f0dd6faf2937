#include "intexpr/ast.hpp"
#include <utility>

namespace intexpr {

NodePtr make_integer(Number value) {
    return std::make_unique<Node>(Node{IntegerLiteral{value}});
}

NodePtr make_binary(BinaryOperator op, NodePtr left, NodePtr right) {
    return std::make_unique<Node>(Node{BinaryOp{op, std::move(left), std::move(right)}});
}

NodePtr make_unary(UnaryOperator op, NodePtr operand) {
    return std::make_unique<Node>(Node{UnaryOp{op, std::move(operand)}});
}

NodePtr make_call(std::string name, std::vector<NodePtr> args) {
    return std::make_unique<Node>(Node{FunctionCall{std::move(name), std::move(args)}});
}

namespace {

bool same(const NodePtr& a, const NodePtr& b) {
    if (!a || !b) return !a && !b;
    return *a == *b;
}

struct Equal {
    const Node::Variant& other;

    bool operator()(const IntegerLiteral& x) const {
        const auto* y = std::get_if<IntegerLiteral>(&other);
        return y && x.value == y->value;
    }
    bool operator()(const BinaryOp& x) const {
        const auto* y = std::get_if<BinaryOp>(&other);
        return y && x.op == y->op && same(x.left, y->left) && same(x.right, y->right);
    }
    bool operator()(const UnaryOp& x) const {
        const auto* y = std::get_if<UnaryOp>(&other);
        return y && x.op == y->op && same(x.operand, y->operand);
    }
    bool operator()(const FunctionCall& x) const {
        const auto* y = std::get_if<FunctionCall>(&other);
        if (!y || x.name != y->name || x.args.size() != y->args.size()) return false;
        for (std::size_t i = 0; i < x.args.size(); ++i) {
            if (!same(x.args[i], y->args[i])) return false;
        }
        return true;
    }
};

struct Dump {
    std::string& out;

    void child(const NodePtr& n) const {
        out += ' ';
        if (n) std::visit(*this, n->v);
        else out += "<null>";
    }

    void operator()(const IntegerLiteral& x) const { out += std::to_string(x.value); }
    void operator()(const BinaryOp& x) const {
        out += '(';
        out += static_cast<char>(x.op);
        child(x.left);
        child(x.right);
        out += ')';
    }
    void operator()(const UnaryOp& x) const {
        out += x.op == UnaryOperator::Minus ? "(neg" : "(pos";
        child(x.operand);
        out += ')';
    }
    void operator()(const FunctionCall& x) const {
        out += "(call ";
        out += x.name;
        for (const auto& a : x.args) child(a);
        out += ')';
    }
};

} // namespace

bool operator==(const Node& a, const Node& b) {
    return std::visit(Equal{b.v}, a.v);
}

bool operator!=(const Node& a, const Node& b) {
    return !(a == b);
}

std::string to_string(const Node& n) {
    std::string out;
    std::visit(Dump{out}, n.v);
    return out;
}

} // namespace intexpr
