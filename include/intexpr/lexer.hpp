#pragma once
#include <string_view>
#include <vector>
#include "intexpr/error.hpp"
#include "intexpr/token.hpp"

namespace intexpr {

/// Produces tokens on demand from a borrowed source text.
/// The text must outlive the lexer. Once EOF is reached every further
/// call to next() returns EOF again.
class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    Result<Token> next();

    // Drains the remaining input; the last token is always End.
    Result<std::vector<Token>> tokenize();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }

    Token fixed(TokKind kind);
    Result<Token> integer();
    Token identifier();

    std::string_view s_;
    std::size_t i_{0};
};

} // namespace intexpr
