#include "intexpr/expr.hpp"
#include <utility>

namespace intexpr {

Result<Number> evaluate(std::string_view expression) {
    Parser parser(expression);
    Result<NodePtr> ast = parser.parse();
    if (!ast) return std::move(ast).error();
    return Evaluator().evaluate(*ast.value());
}

Result<Number> evaluate(std::string_view expression, const FunctionRegistry& functions) {
    Parser parser(expression);
    Result<NodePtr> ast = parser.parse();
    if (!ast) return std::move(ast).error();
    return Evaluator(functions).evaluate(*ast.value());
}

} // namespace intexpr
