#pragma once
#include <vector>
#include "intexpr/ast.hpp"
#include "intexpr/error.hpp"
#include "intexpr/functions.hpp"

namespace intexpr {

/// Tree-walking evaluator over 64-bit integers.
///
/// Operands are evaluated left to right, call arguments too, and all of them
/// are evaluated before the callee runs. Division truncates toward zero.
/// Results that do not fit in Number are reported as ErrorKind::Overflow.
///
/// The registry is borrowed and only read; it must outlive the evaluator.
class Evaluator {
public:
    Evaluator();
    explicit Evaluator(const FunctionRegistry& functions) : fns_(&functions) {}

    Result<Number> evaluate(const Node& node) const;

private:
    struct Visitor;

    Result<Number> call(const FunctionCall& fc) const;

    const FunctionRegistry* fns_;
};

// Checked arithmetic used by the evaluator; exposed for hosts that build
// functions with the same overflow policy.
Result<Number> checked_add(Number a, Number b);
Result<Number> checked_sub(Number a, Number b);
Result<Number> checked_mul(Number a, Number b);
Result<Number> checked_div(Number a, Number b);
Result<Number> checked_neg(Number a);

} // namespace intexpr
