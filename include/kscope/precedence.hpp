#pragma once
#include <cstddef>
#include <map>
#include <optional>

namespace kscope {

constexpr int kDefaultBinaryPrecedence = 30;
constexpr int kMinPrecedence = 1;
constexpr int kMaxPrecedence = 100;

// Deepest expression nesting (parentheses, unary chains, nested bodies) a
// parser accepts before failing with ParseErrorKind::NestingTooDeep.
constexpr int kMaxNestingDepth = 256;

/// Binary operator precedences for one parsing session; higher binds tighter.
/// Starts with < (10), + - (20) and * / (40).
class PrecedenceTable {
public:
    PrecedenceTable();

    std::optional<int> lookup(char op) const;
    bool contains(char op) const { return table_.count(op) != 0; }

    // Inserts or overwrites.
    void set(char op, int precedence) { table_[op] = precedence; }

    std::size_t size() const { return table_.size(); }

private:
    std::map<char, int> table_;
};

} // namespace kscope
