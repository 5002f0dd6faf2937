#pragma once
#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace intexpr {

enum class ErrorKind {
    Lex,
    Parse,
    DivisionByZero,
    UnknownFunction,
    FunctionInvocation,
    Overflow,
};

const char* to_string(ErrorKind kind);

struct Error {
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    ErrorKind kind{ErrorKind::Parse};
    std::string message{};
    std::size_t offset{npos};          // source offset (Lex / Parse)
    std::string function{};            // UnknownFunction / FunctionInvocation
    std::string cause{};               // FunctionInvocation: what() of the original failure
    std::exception_ptr original{};     // FunctionInvocation: the exception the callable threw

    bool has_offset() const { return offset != npos; }

    // "<Kind>: <message>"
    std::string to_string() const;
};

Error lex_error(std::string message, std::size_t offset);
Error parse_error(std::string message, std::size_t offset);
Error division_by_zero();
Error unknown_function(const std::string& name);
Error invocation_error(const std::string& name, const std::exception& cause, std::exception_ptr original);
Error invocation_error(const std::string& name, std::string cause, std::exception_ptr original);
Error overflow_error(char op);

/// Either a value or the Error that prevented producing it.
template <class T>
class Result {
public:
    Result(T value) : v_(std::move(value)) {}
    Result(Error error) : v_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(v_); }
    explicit operator bool() const { return ok(); }

    // Throws std::bad_variant_access when !ok().
    T& value() & { return std::get<T>(v_); }
    const T& value() const& { return std::get<T>(v_); }
    T&& value() && { return std::get<T>(std::move(v_)); }

    const Error& error() const& { return std::get<Error>(v_); }
    Error&& error() && { return std::get<Error>(std::move(v_)); }

private:
    std::variant<T, Error> v_;
};

/// Outcome of a step that produces no value: empty on success.
using Status = std::optional<Error>;

} // namespace intexpr
