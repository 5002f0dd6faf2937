#include "intexpr/lexer.hpp"
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace intexpr {

static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void Lexer::skip_ws() {
    while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

Token Lexer::fixed(TokKind kind) {
    Token t{kind};
    t.text = std::string(1, s_[i_]);
    t.offset = i_;
    ++i_;
    return t;
}

Result<Token> Lexer::integer() {
    // one past Number's max so that "-9223372036854775808" can be written
    constexpr std::uint64_t kMax = static_cast<std::uint64_t>(std::numeric_limits<Number>::max()) + 1;

    Token t{TokKind::Integer};
    t.offset = i_;
    std::uint64_t v = 0;
    bool overflow = false;
    while (!is_end() && is_digit(s_[i_])) {
        std::uint64_t d = static_cast<std::uint64_t>(s_[i_] - '0');
        // keep scanning the whole run so the error names the literal's start
        if (!overflow && v > (kMax - d) / 10) overflow = true;
        if (!overflow) v = v * 10 + d;
        ++i_;
    }
    if (overflow) return lex_error("Integer literal out of range", t.offset);
    t.value = v;
    t.text = std::string(s_.substr(t.offset, i_ - t.offset));
    return t;
}

Token Lexer::identifier() {
    std::size_t start = i_++;
    while (!is_end() && is_ident_char(s_[i_])) ++i_;
    Token t{TokKind::Ident};
    t.text = std::string(s_.substr(start, i_ - start));
    t.offset = start;
    return t;
}

Result<Token> Lexer::next() {
    skip_ws();
    if (is_end()) {
        Token t{TokKind::End};
        t.offset = s_.size();
        return t;
    }

    char c = s_[i_];

    switch (c) {
        case '+': return fixed(TokKind::Plus);
        case '-': return fixed(TokKind::Minus);
        case '*': return fixed(TokKind::Star);
        case '/': return fixed(TokKind::Slash);
        case '(': return fixed(TokKind::LParen);
        case ')': return fixed(TokKind::RParen);
        case ',': return fixed(TokKind::Comma);
        default: break;
    }

    if (is_digit(c)) return integer();
    if (is_ident_start(c)) return identifier();

    return lex_error(std::string("Unexpected character '") + c + "'", i_);
}

Result<std::vector<Token>> Lexer::tokenize() {
    std::vector<Token> out;
    for (;;) {
        Result<Token> t = next();
        if (!t) return std::move(t).error();
        bool done = t.value().kind == TokKind::End;
        out.push_back(std::move(t).value());
        if (done) break;
    }
    return out;
}

const char* to_string(TokKind kind) {
    switch (kind) {
        case TokKind::Integer: return "INTEGER";
        case TokKind::Ident:   return "IDENTIFIER";
        case TokKind::Plus:    return "PLUS";
        case TokKind::Minus:   return "MINUS";
        case TokKind::Star:    return "MUL";
        case TokKind::Slash:   return "DIV";
        case TokKind::LParen:  return "LPAREN";
        case TokKind::RParen:  return "RPAREN";
        case TokKind::Comma:   return "COMMA";
        case TokKind::End:     return "EOF";
    }
    return "UNKNOWN";
}

} // namespace intexpr
