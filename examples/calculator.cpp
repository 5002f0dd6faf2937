#include <intexpr/expr.hpp>

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace calc {

using intexpr::Number;

static void require_args(const char* name, const std::vector<Number>& args, std::size_t n) {
    if (args.size() != n) {
        throw std::invalid_argument(std::string(name) + " expects " + std::to_string(n) + " argument(s)");
    }
}

static void require_some(const char* name, const std::vector<Number>& args) {
    if (args.empty()) throw std::invalid_argument(std::string(name) + " expects at least one argument");
}

// Math functions available to expressions typed at the calculator.
static intexpr::FunctionTable make_functions() {
    intexpr::FunctionTable fns;

    fns.add("max", [](const std::vector<Number>& a) {
        require_some("max", a);
        return *std::max_element(a.begin(), a.end());
    });
    fns.add("min", [](const std::vector<Number>& a) {
        require_some("min", a);
        return *std::min_element(a.begin(), a.end());
    });
    fns.add("abs", [](const std::vector<Number>& a) {
        require_args("abs", a, 1);
        intexpr::Result<Number> r = a[0] < 0 ? intexpr::checked_neg(a[0]) : intexpr::Result<Number>(a[0]);
        if (!r) throw std::overflow_error(r.error().message);
        return r.value();
    });
    fns.add("add", [](const std::vector<Number>& a) {
        require_args("add", a, 2);
        intexpr::Result<Number> r = intexpr::checked_add(a[0], a[1]);
        if (!r) throw std::overflow_error(r.error().message);
        return r.value();
    });
    fns.add("pow", [](const std::vector<Number>& a) {
        require_args("pow", a, 2);
        if (a[1] < 0) throw std::domain_error("pow expects a non-negative exponent");
        Number acc = 1;
        for (Number i = 0; i < a[1]; ++i) {
            intexpr::Result<Number> r = intexpr::checked_mul(acc, a[0]);
            if (!r) throw std::overflow_error(r.error().message);
            acc = r.value();
        }
        return acc;
    });
    fns.add("clamp", [](const std::vector<Number>& a) {
        require_args("clamp", a, 3);
        if (a[1] > a[2]) throw std::invalid_argument("clamp expects lo <= hi");
        return std::max(a[1], std::min(a[2], a[0]));
    });

    return fns;
}

static bool run(const std::string& text, const intexpr::FunctionRegistry& fns) {
    intexpr::Result<Number> r = intexpr::evaluate(text, fns);
    if (!r) {
        std::cerr << text << "\n  " << r.error().to_string() << "\n";
        return false;
    }
    std::cout << text << " = " << r.value() << "\n";
    return true;
}

} // namespace calc

int main(int argc, char** argv) {
    const intexpr::FunctionTable fns = calc::make_functions();
    bool all_ok = true;

    if (argc > 1) {
        for (int i = 1; i < argc; ++i) all_ok = calc::run(argv[i], fns) && all_ok;
        return all_ok ? 0 : 1;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        all_ok = calc::run(line, fns) && all_ok;
    }
    return all_ok ? 0 : 1;
}
