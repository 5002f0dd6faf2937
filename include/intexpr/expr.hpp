#pragma once
#include <string_view>
#include "intexpr/ast.hpp"
#include "intexpr/error.hpp"
#include "intexpr/evaluator.hpp"
#include "intexpr/functions.hpp"
#include "intexpr/lexer.hpp"
#include "intexpr/parser.hpp"
#include "intexpr/token.hpp"

namespace intexpr {

/// Parse and evaluate `expression` with no functions available.
/// Any call fails with ErrorKind::UnknownFunction.
Result<Number> evaluate(std::string_view expression);

/// Parse and evaluate `expression`, resolving calls against `functions`.
Result<Number> evaluate(std::string_view expression, const FunctionRegistry& functions);

} // namespace intexpr
