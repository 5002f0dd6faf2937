#include "intexpr/error.hpp"

namespace intexpr {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Lex:                return "LexError";
        case ErrorKind::Parse:              return "ParseError";
        case ErrorKind::DivisionByZero:     return "DivisionByZeroError";
        case ErrorKind::UnknownFunction:    return "UnknownFunctionError";
        case ErrorKind::FunctionInvocation: return "FunctionInvocationError";
        case ErrorKind::Overflow:           return "OverflowError";
    }
    return "Error";
}

std::string Error::to_string() const {
    return std::string(intexpr::to_string(kind)) + ": " + message;
}

Error lex_error(std::string message, std::size_t offset) {
    Error e;
    e.kind = ErrorKind::Lex;
    e.message = std::move(message) + " at offset " + std::to_string(offset);
    e.offset = offset;
    return e;
}

Error parse_error(std::string message, std::size_t offset) {
    Error e;
    e.kind = ErrorKind::Parse;
    e.message = std::move(message) + " at offset " + std::to_string(offset);
    e.offset = offset;
    return e;
}

Error division_by_zero() {
    Error e;
    e.kind = ErrorKind::DivisionByZero;
    e.message = "Division by zero";
    return e;
}

Error unknown_function(const std::string& name) {
    Error e;
    e.kind = ErrorKind::UnknownFunction;
    e.message = "Unknown function: " + name;
    e.function = name;
    return e;
}

Error invocation_error(const std::string& name, const std::exception& cause, std::exception_ptr original) {
    return invocation_error(name, std::string(cause.what()), std::move(original));
}

Error invocation_error(const std::string& name, std::string cause, std::exception_ptr original) {
    Error e;
    e.kind = ErrorKind::FunctionInvocation;
    e.function = name;
    e.cause = std::move(cause);
    e.message = "Error calling function " + name + ": " + e.cause;
    e.original = std::move(original);
    return e;
}

Error overflow_error(char op) {
    Error e;
    e.kind = ErrorKind::Overflow;
    e.message = std::string("Integer overflow in '") + op + "'";
    return e;
}

} // namespace intexpr
