#include "intexpr/functions.hpp"

namespace intexpr {

void FunctionTable::add(std::string name, Function fn) {
    fns_[std::move(name)] = std::move(fn);
}

bool FunctionTable::remove(std::string_view name) {
    auto it = fns_.find(name);
    if (it == fns_.end()) return false;
    fns_.erase(it);
    return true;
}

const Function* FunctionTable::find(std::string_view name) const {
    auto it = fns_.find(name);
    if (it == fns_.end()) return nullptr;
    return &it->second;
}

} // namespace intexpr
