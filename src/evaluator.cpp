#include "intexpr/evaluator.hpp"
#include <exception>
#include <limits>
#include <utility>

namespace intexpr {

static constexpr Number kMin = std::numeric_limits<Number>::min();
static constexpr Number kMax = std::numeric_limits<Number>::max();

Result<Number> checked_add(Number a, Number b) {
    if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) return overflow_error('+');
    return a + b;
}

Result<Number> checked_sub(Number a, Number b) {
    if ((b < 0 && a > kMax + b) || (b > 0 && a < kMin + b)) return overflow_error('-');
    return a - b;
}

Result<Number> checked_mul(Number a, Number b) {
    bool overflow = false;
    if (a > 0) {
        overflow = b > 0 ? a > kMax / b : b < kMin / a;
    } else if (a < 0) {
        overflow = b > 0 ? a < kMin / b : (b != 0 && a < kMax / b);
    }
    if (overflow) return overflow_error('*');
    return a * b;
}

Result<Number> checked_div(Number a, Number b) {
    if (b == 0) return division_by_zero();
    if (a == kMin && b == -1) return overflow_error('/');
    return a / b;
}

Result<Number> checked_neg(Number a) {
    if (a == kMin) return overflow_error('-');
    return -a;
}

static const FunctionRegistry& empty_registry() {
    static const FunctionTable table{};
    return table;
}

Evaluator::Evaluator() : fns_(&empty_registry()) {}

// One overload per node alternative; a new alternative without an overload
// fails to compile in std::visit.
struct Evaluator::Visitor {
    const Evaluator& ev;

    Result<Number> operator()(const IntegerLiteral& n) const {
        return n.value;
    }

    Result<Number> operator()(const UnaryOp& n) const {
        Result<Number> x = ev.evaluate(*n.operand);
        if (!x) return x;
        switch (n.op) {
            case UnaryOperator::Plus:  return x;
            case UnaryOperator::Minus: return checked_neg(x.value());
        }
        return x;
    }

    Result<Number> operator()(const BinaryOp& n) const {
        Result<Number> a = ev.evaluate(*n.left);
        if (!a) return a;
        Result<Number> b = ev.evaluate(*n.right);
        if (!b) return b;
        switch (n.op) {
            case BinaryOperator::Add: return checked_add(a.value(), b.value());
            case BinaryOperator::Sub: return checked_sub(a.value(), b.value());
            case BinaryOperator::Mul: return checked_mul(a.value(), b.value());
            case BinaryOperator::Div: return checked_div(a.value(), b.value());
        }
        return a;
    }

    Result<Number> operator()(const FunctionCall& n) const {
        return ev.call(n);
    }
};

Result<Number> Evaluator::evaluate(const Node& node) const {
    return std::visit(Visitor{*this}, node.v);
}

Result<Number> Evaluator::call(const FunctionCall& fc) const {
    const Function* fn = fns_->find(fc.name);
    if (!fn) return unknown_function(fc.name);

    std::vector<Number> args;
    args.reserve(fc.args.size());
    for (const auto& a : fc.args) {
        Result<Number> v = evaluate(*a);
        if (!v) return v;
        args.push_back(v.value());
    }

    try {
        return (*fn)(args);
    } catch (const std::exception& e) {
        return invocation_error(fc.name, e, std::current_exception());
    } catch (...) {
        // not a std::exception: no message to keep, only the exception itself
        return invocation_error(fc.name, "unknown exception", std::current_exception());
    }
}

} // namespace intexpr
