#pragma once
#include <string>
#include <string_view>
#include "intexpr/ast.hpp"
#include "intexpr/error.hpp"
#include "intexpr/lexer.hpp"

namespace intexpr {

/// Recursive-descent parser:
///
///   expression := term (('+' | '-') term)*
///   term       := factor (('*' | '/') factor)*
///   factor     := ('+' | '-') factor | INTEGER | IDENT '(' args ')' | '(' expression ')'
///   args       := (expression (',' expression)*)?
///
/// The text must outlive the parser. Each parse() starts from the beginning
/// of the text, so repeated calls build equal trees.
class Parser {
public:
    explicit Parser(std::string_view input) : input_(input), lex_(input) {}

    // The whole input must be one expression followed by EOF.
    Result<NodePtr> parse();

private:
    Status advance();
    Status expect(TokKind kind);

    Result<NodePtr> parse_expression();
    Result<NodePtr> parse_term();
    Result<NodePtr> parse_factor();
    Result<NodePtr> parse_call(std::string name);

    std::string_view input_;
    Lexer lex_;
    Token cur_{};
};

} // namespace intexpr
