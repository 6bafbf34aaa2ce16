#pragma once
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "kscope/token.hpp"

namespace kscope {

constexpr const char* kAnonymousPrefix = "__anon_expr_";

class ExprVisitor;

struct Expr {
    explicit Expr(SourcePos p) : pos(p) {}
    virtual ~Expr() = default;
    virtual void accept(ExprVisitor& v) const = 0;

    SourcePos pos;
};

using ExprPtr = std::unique_ptr<Expr>;

struct NumberExpr;
struct VariableExpr;
struct UnaryExpr;
struct BinaryExpr;
struct CallExpr;
struct IfExpr;
struct ForExpr;
struct VarExpr;

/// Downstream consumers (code generators, printers) walk expressions through
/// this interface.
class ExprVisitor {
public:
    virtual ~ExprVisitor() = default;
    virtual void visit(const NumberExpr& e) = 0;
    virtual void visit(const VariableExpr& e) = 0;
    virtual void visit(const UnaryExpr& e) = 0;
    virtual void visit(const BinaryExpr& e) = 0;
    virtual void visit(const CallExpr& e) = 0;
    virtual void visit(const IfExpr& e) = 0;
    virtual void visit(const ForExpr& e) = 0;
    virtual void visit(const VarExpr& e) = 0;
};

struct NumberExpr : Expr {
    NumberExpr(double v, SourcePos p) : Expr(p), value(v) {}
    void accept(ExprVisitor& v) const override { v.visit(*this); }

    double value;
};

struct VariableExpr : Expr {
    VariableExpr(std::string n, SourcePos p) : Expr(p), name(std::move(n)) {}
    void accept(ExprVisitor& v) const override { v.visit(*this); }

    std::string name;
};

struct UnaryExpr : Expr {
    UnaryExpr(char o, ExprPtr e, SourcePos p) : Expr(p), op(o), operand(std::move(e)) {}
    void accept(ExprVisitor& v) const override { v.visit(*this); }

    char op;
    ExprPtr operand;
};

struct BinaryExpr : Expr {
    BinaryExpr(char o, ExprPtr l, ExprPtr r, SourcePos p)
        : Expr(p), op(o), lhs(std::move(l)), rhs(std::move(r)) {}
    void accept(ExprVisitor& v) const override { v.visit(*this); }

    char op;
    ExprPtr lhs;
    ExprPtr rhs;
};

struct CallExpr : Expr {
    CallExpr(std::string c, std::vector<ExprPtr> a, SourcePos p)
        : Expr(p), callee(std::move(c)), args(std::move(a)) {}
    void accept(ExprVisitor& v) const override { v.visit(*this); }

    std::string callee;
    std::vector<ExprPtr> args;
};

struct IfExpr : Expr {
    IfExpr(ExprPtr c, ExprPtr t, ExprPtr e, SourcePos p)
        : Expr(p), cond(std::move(c)), then_branch(std::move(t)), else_branch(std::move(e)) {}
    void accept(ExprVisitor& v) const override { v.visit(*this); }

    ExprPtr cond;
    ExprPtr then_branch;
    ExprPtr else_branch;
};

// for var = start, end[, step] in body
struct ForExpr : Expr {
    ForExpr(std::string v, ExprPtr s, ExprPtr e, ExprPtr st, ExprPtr b, SourcePos p)
        : Expr(p), var(std::move(v)), start(std::move(s)), end(std::move(e)),
          step(std::move(st)), body(std::move(b)) {}
    void accept(ExprVisitor& v) const override { v.visit(*this); }

    std::string var;
    ExprPtr start;
    ExprPtr end;
    ExprPtr step; // null when omitted; the step is then 1.0
    ExprPtr body;
};

// var a = x, b = y in body
struct VarExpr : Expr {
    using Binding = std::pair<std::string, ExprPtr>;

    VarExpr(std::vector<Binding> b, ExprPtr bd, SourcePos p)
        : Expr(p), bindings(std::move(b)), body(std::move(bd)) {}
    void accept(ExprVisitor& v) const override { v.visit(*this); }

    std::vector<Binding> bindings;
    ExprPtr body;
};

/// Function signature. For operator declarations `name` is the operator
/// character itself and the arity tells unary (1) from binary (2).
struct Prototype {
    std::string name;
    std::vector<std::string> params;
    bool is_operator{false};
    std::optional<int> precedence{}; // only for binary operators declared with a literal
    SourcePos pos{};

    bool is_unary_op() const { return is_operator && params.size() == 1; }
    bool is_binary_op() const { return is_operator && params.size() == 2; }
    char operator_char() const { return name.empty() ? '\0' : name.back(); }

    /// Name a code generator registers the definition under: "unary!",
    /// "binary|", or the plain function name.
    std::string symbol_name() const {
        if (!is_operator) return name;
        return (params.size() == 1 ? "unary" : "binary") + name;
    }
};

struct Function {
    Prototype proto;
    ExprPtr body;

    bool is_anonymous() const { return proto.name.rfind(kAnonymousPrefix, 0) == 0; }
};

using Item = std::variant<Function, Prototype>;
using Program = std::vector<Item>;

} // namespace kscope
