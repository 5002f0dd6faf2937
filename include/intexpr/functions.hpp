#pragma once
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "intexpr/token.hpp"

namespace intexpr {

/// A host function. Arity is not checked by the evaluator; a callable that
/// cannot handle its arguments reports it by throwing a std::exception.
using Function = std::function<Number(const std::vector<Number>&)>;

/// Name -> function lookup used while evaluating calls.
/// Implementations must be safe for concurrent find() if shared across threads.
class FunctionRegistry {
public:
    virtual ~FunctionRegistry() = default;

    // nullptr when the name is not registered.
    virtual const Function* find(std::string_view name) const = 0;
};

class FunctionTable final : public FunctionRegistry {
public:
    FunctionTable() = default;
    FunctionTable(std::initializer_list<std::pair<const std::string, Function>> init) : fns_(init) {}

    // Replaces an existing entry with the same name.
    void add(std::string name, Function fn);
    bool remove(std::string_view name);

    bool contains(std::string_view name) const { return find(name) != nullptr; }
    std::size_t size() const { return fns_.size(); }
    bool empty() const { return fns_.empty(); }

    const Function* find(std::string_view name) const override;

private:
    std::map<std::string, Function, std::less<>> fns_;
};

} // namespace intexpr
