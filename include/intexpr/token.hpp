#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace intexpr {

using Number = std::int64_t;

enum class TokKind {
    Integer,
    Ident,

    Plus, Minus, Star, Slash,
    LParen, RParen,
    Comma,
    End,
};

// Upper-case kind name used in diagnostics: INTEGER, PLUS, MUL, EOF, ...
const char* to_string(TokKind kind);

struct Token {
    TokKind kind{TokKind::End};
    std::string text{};      // Ident name, or the literal character of a fixed token
    std::uint64_t value{0};  // Integer magnitude, at most 2^63 (only valid under unary minus)
    std::size_t offset{0};   // byte offset of the first character
};

} // namespace intexpr
