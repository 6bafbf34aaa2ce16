#pragma once
#include <string>

#include "kscope/ast.hpp"

namespace kscope {

// S-expression dumps of the AST, e.g. "(def foo (a b) (+ a b))".
std::string to_sexpr(const Expr& e);
std::string to_sexpr(const Prototype& p);
std::string to_sexpr(const Function& f);
std::string to_sexpr(const Item& item);

} // namespace kscope
