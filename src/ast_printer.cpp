#include "kscope/ast_printer.hpp"
#include <sstream>

namespace kscope {

namespace {

class SexprPrinter : public ExprVisitor {
public:
    explicit SexprPrinter(std::ostream& out) : out_(out) {}

    void print(const Expr& e) { e.accept(*this); }

    void visit(const NumberExpr& e) override { out_ << format_number(e.value); }

    void visit(const VariableExpr& e) override { out_ << e.name; }

    void visit(const UnaryExpr& e) override {
        out_ << '(' << e.op << ' ';
        print(*e.operand);
        out_ << ')';
    }

    void visit(const BinaryExpr& e) override {
        out_ << '(' << e.op << ' ';
        print(*e.lhs);
        out_ << ' ';
        print(*e.rhs);
        out_ << ')';
    }

    void visit(const CallExpr& e) override {
        out_ << "(call " << e.callee;
        for (const auto& arg : e.args) {
            out_ << ' ';
            print(*arg);
        }
        out_ << ')';
    }

    void visit(const IfExpr& e) override {
        out_ << "(if ";
        print(*e.cond);
        out_ << ' ';
        print(*e.then_branch);
        out_ << ' ';
        print(*e.else_branch);
        out_ << ')';
    }

    void visit(const ForExpr& e) override {
        out_ << "(for (" << e.var << ' ';
        print(*e.start);
        out_ << ' ';
        print(*e.end);
        if (e.step) {
            out_ << ' ';
            print(*e.step);
        }
        out_ << ") ";
        print(*e.body);
        out_ << ')';
    }

    void visit(const VarExpr& e) override {
        out_ << "(var (";
        bool first = true;
        for (const auto& b : e.bindings) {
            if (!first) out_ << ' ';
            first = false;
            out_ << '(' << b.first << ' ';
            print(*b.second);
            out_ << ')';
        }
        out_ << ") ";
        print(*e.body);
        out_ << ')';
    }

private:
    std::ostream& out_;
};

// "foo (a b)", "binary| 10 (a b)" or "unary! (v)"
void print_signature(std::ostream& out, const Prototype& p) {
    out << p.symbol_name();
    if (p.precedence) out << ' ' << *p.precedence;
    out << " (";
    for (std::size_t i = 0; i < p.params.size(); ++i) {
        if (i) out << ' ';
        out << p.params[i];
    }
    out << ')';
}

} // namespace

std::string to_sexpr(const Expr& e) {
    std::ostringstream os;
    SexprPrinter(os).print(e);
    return os.str();
}

std::string to_sexpr(const Prototype& p) {
    std::ostringstream os;
    os << "(proto ";
    print_signature(os, p);
    os << ')';
    return os.str();
}

std::string to_sexpr(const Function& f) {
    std::ostringstream os;
    os << "(def ";
    print_signature(os, f.proto);
    os << ' ';
    SexprPrinter(os).print(*f.body);
    os << ')';
    return os.str();
}

std::string to_sexpr(const Item& item) {
    if (const auto* fn = std::get_if<Function>(&item)) return to_sexpr(*fn);

    std::ostringstream os;
    os << "(extern ";
    print_signature(os, std::get<Prototype>(item));
    os << ')';
    return os.str();
}

} // namespace kscope
