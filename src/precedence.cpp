#include "kscope/precedence.hpp"

namespace kscope {

PrecedenceTable::PrecedenceTable()
    : table_{{'<', 10}, {'+', 20}, {'-', 20}, {'*', 40}, {'/', 40}} {}

std::optional<int> PrecedenceTable::lookup(char op) const {
    auto it = table_.find(op);
    if (it == table_.end()) return std::nullopt;
    return it->second;
}

} // namespace kscope
