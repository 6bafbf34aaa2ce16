#include <kscope/ast_printer.hpp>
#include <kscope/parser.hpp>

#include <iostream>
#include <set>
#include <string>
#include <variant>

namespace toy {

// Stand-in for a code generator: records the symbols a function body would
// have to resolve, using the same names operator definitions are registered under.
struct SymbolCollector : kscope::ExprVisitor {
    std::set<std::string> symbols;

    void visit(const kscope::NumberExpr&) override {}
    void visit(const kscope::VariableExpr&) override {}

    void visit(const kscope::UnaryExpr& e) override {
        symbols.insert(std::string("unary") + e.op);
        e.operand->accept(*this);
    }

    void visit(const kscope::BinaryExpr& e) override {
        // built-ins lower to instructions
        if (std::string("<+-*/").find(e.op) == std::string::npos) {
            symbols.insert(std::string("binary") + e.op);
        }
        e.lhs->accept(*this);
        e.rhs->accept(*this);
    }

    void visit(const kscope::CallExpr& e) override {
        symbols.insert(e.callee);
        for (const auto& a : e.args) a->accept(*this);
    }

    void visit(const kscope::IfExpr& e) override {
        e.cond->accept(*this);
        e.then_branch->accept(*this);
        e.else_branch->accept(*this);
    }

    void visit(const kscope::ForExpr& e) override {
        e.start->accept(*this);
        e.end->accept(*this);
        if (e.step) e.step->accept(*this);
        e.body->accept(*this);
    }

    void visit(const kscope::VarExpr& e) override {
        for (const auto& b : e.bindings) b.second->accept(*this);
        e.body->accept(*this);
    }
};

} // namespace toy

static const char* kSource = R"(# operators defined in the language itself
extern putchard(c);
def unary!(v) if v then 0 else 1;
def binary| 5 (a b) if a then 1 else if b then 1 else 0;
def binary : 1 (x y) y;

def fib(x)
  if x < 3 then 1 else fib(x-1) + fib(x-2);

def stars(n)
  var total = 0 in
  (for i = 1, i < n, 1 in putchard(42)) : total;

fib(10) | !0;
1 ^ 2;
def broken(x) x +;
)";

int main() {
    auto report = kscope::parse_recovering(kSource);

    for (const auto& item : report.items) {
        std::cout << kscope::to_sexpr(item) << "\n";

        if (const auto* fn = std::get_if<kscope::Function>(&item)) {
            toy::SymbolCollector collect;
            fn->body->accept(collect);
            std::cout << "  needs:";
            for (const auto& s : collect.symbols) std::cout << ' ' << s;
            std::cout << (fn->is_anonymous() ? "  [run now]\n" : "\n");
        }
    }

    for (const auto& err : report.errors) {
        std::cerr << kscope::format_diagnostic(err, kSource);
    }

    return report.errors.empty() ? 0 : 1;
}
