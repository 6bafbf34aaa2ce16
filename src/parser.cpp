#include "kscope/parser.hpp"
#include <cmath>
#include <memory>
#include <utility>

namespace kscope {

// Punctuation the grammar itself uses; it can never name an operator.
static bool is_structural(char c) {
    return c == '(' || c == ')' || c == ',' || c == ';';
}

namespace {

struct DepthGuard {
    explicit DepthGuard(int& d) : depth(d) { ++depth; }
    ~DepthGuard() { --depth; }
    int& depth;
};

} // namespace

void Parser::rollback(Checkpoint c) {
    binops_ = std::move(c.binops);
    unops_ = std::move(c.unops);
    anon_count_ = c.anon_count;
}

std::optional<ParseError> Parser::consume() {
    auto r = lex_.next();
    if (!r) return ParseError(r.error());
    cur_ = std::move(r.value());
    return std::nullopt;
}

std::optional<ParseError> Parser::prime() {
    if (primed_) return std::nullopt;
    if (auto err = consume()) return err;
    primed_ = true;
    return std::nullopt;
}

void Parser::synchronize() {
    for (;;) {
        if (primed_ && (cur_.kind == TokKind::End || cur_.is_op(';'))) return;
        // lexical errors inside the discarded text are dropped with it
        if (!consume()) primed_ = true;
    }
}

std::optional<int> Parser::binary_precedence(const Token& t) const {
    if (t.kind != TokKind::Op) return std::nullopt;
    return binops_.lookup(t.op);
}

// Only asked about symbols in binary position, where a unary-only
// operator is as unknown as an undeclared one.
bool Parser::is_known_operator(char c) const {
    return is_structural(c) || binops_.contains(c);
}

ParseError Parser::unexpected(ParseErrorKind kind, std::string expected) const {
    if (cur_.kind == TokKind::Op && !is_known_operator(cur_.op) &&
        (kind == ParseErrorKind::UnexpectedToken || kind == ParseErrorKind::MissingTerminator)) {
        kind = ParseErrorKind::UnknownOperator;
    }
    return ParseError(kind, cur_.pos, std::move(expected), describe(cur_));
}

std::optional<ParseError> Parser::expect_op(char c, ParseErrorKind kind) {
    if (!cur_.is_op(c)) return unexpected(kind, std::string("'") + c + "'");
    return consume();
}

std::optional<ParseError> Parser::expect_keyword(Keyword k) {
    if (!cur_.is_keyword(k)) {
        return unexpected(ParseErrorKind::UnexpectedToken, std::string("'") + keyword_spelling(k) + "'");
    }
    return consume();
}

Result<std::string> Parser::expect_ident(const char* what) {
    if (cur_.kind != TokKind::Ident) return unexpected(ParseErrorKind::UnexpectedToken, what);
    std::string name = cur_.text;
    if (auto err = consume()) return *err;
    return name;
}

// -----------------------------
// top level
// -----------------------------
Result<std::optional<Item>> Parser::next_item() {
    if (auto err = prime()) return *err;
    while (cur_.is_op(';')) {
        if (auto err = consume()) return *err;
    }
    if (cur_.kind == TokKind::End) return std::optional<Item>();

    // A rejected item declares no operators and uses up no anonymous name.
    Checkpoint saved = checkpoint();
    auto fail = [&](ParseError e) {
        rollback(std::move(saved));
        return e;
    };

    std::optional<Item> item;
    if (cur_.is_keyword(Keyword::Def)) {
        auto fn = parse_definition();
        if (!fn) return fail(fn.error());
        item = Item(std::move(fn.value()));
    } else if (cur_.is_keyword(Keyword::Extern)) {
        auto proto = parse_extern();
        if (!proto) return fail(proto.error());
        item = Item(std::move(proto.value()));
    } else {
        auto fn = parse_top_level_expr();
        if (!fn) return fail(fn.error());
        item = Item(std::move(fn.value()));
    }

    // The ';' stays as lookahead; the next call skips it.
    if (!cur_.is_op(';')) return fail(unexpected(ParseErrorKind::MissingTerminator, "';'"));
    return item;
}

// definition ::= 'def' prototype expression
Result<Function> Parser::parse_definition() {
    if (auto err = prime()) return *err;
    if (auto err = expect_keyword(Keyword::Def)) return *err;

    Checkpoint saved = checkpoint();
    auto proto = parse_prototype();
    if (!proto) return proto.error();
    auto body = parse_expression(0);
    if (!body) {
        // the operator was only declared for the sake of its own body
        rollback(std::move(saved));
        return body.error();
    }
    return Function{std::move(proto.value()), std::move(body.value())};
}

// external ::= 'extern' prototype
Result<Prototype> Parser::parse_extern() {
    if (auto err = prime()) return *err;
    if (auto err = expect_keyword(Keyword::Extern)) return *err;
    return parse_prototype();
}

// toplevelexpr ::= expression, wrapped as a nullary function
Result<Function> Parser::parse_top_level_expr() {
    if (auto err = prime()) return *err;
    SourcePos pos = cur_.pos;

    auto body = parse_expression(0);
    if (!body) return body.error();

    Prototype proto;
    proto.name = kAnonymousPrefix + std::to_string(++anon_count_);
    proto.pos = pos;
    return Function{std::move(proto), std::move(body.value())};
}

// prototype ::= id '(' id* ')'
//           ::= 'unary' OP '(' id ')'
//           ::= 'binary' OP number? '(' id id ')'
Result<Prototype> Parser::parse_prototype() {
    Prototype proto;
    proto.pos = cur_.pos;
    std::size_t arity = 0;
    const char* fixity = "";

    if (cur_.kind == TokKind::Ident) {
        proto.name = cur_.text;
        if (auto err = consume()) return *err;
    } else if (cur_.is_keyword(Keyword::Unary) || cur_.is_keyword(Keyword::Binary)) {
        arity = cur_.is_keyword(Keyword::Unary) ? 1 : 2;
        fixity = keyword_spelling(cur_.keyword);
        if (auto err = consume()) return *err;

        if (cur_.kind != TokKind::Op || is_structural(cur_.op)) {
            return ParseError(ParseErrorKind::InvalidOperatorDeclaration, cur_.pos,
                              std::string("operator symbol after '") + fixity + "'", describe(cur_));
        }
        proto.name = std::string(1, cur_.op);
        proto.is_operator = true;
        if (auto err = consume()) return *err;

        if (arity == 2 && cur_.kind == TokKind::Number) {
            double v = cur_.number;
            if (v != std::floor(v) || v < kMinPrecedence || v > kMaxPrecedence) {
                return ParseError(ParseErrorKind::InvalidOperatorDeclaration, cur_.pos,
                                  "precedence between " + std::to_string(kMinPrecedence) + " and " +
                                      std::to_string(kMaxPrecedence),
                                  describe(cur_));
            }
            proto.precedence = static_cast<int>(v);
            if (auto err = consume()) return *err;
        }
    } else {
        return unexpected(ParseErrorKind::UnexpectedToken, "function name in prototype");
    }

    if (auto err = expect_op('(', ParseErrorKind::UnexpectedToken)) return *err;
    while (cur_.kind == TokKind::Ident) {
        proto.params.push_back(cur_.text);
        if (auto err = consume()) return *err;
    }
    if (!cur_.is_op(')')) return unexpected(ParseErrorKind::MissingTerminator, "identifier or ')'");
    if (auto err = consume()) return *err;

    if (proto.is_operator && proto.params.size() != arity) {
        return ParseError(ParseErrorKind::InvalidOperatorDeclaration, proto.pos,
                          std::to_string(arity) + (arity == 1 ? " parameter" : " parameters") +
                              " for " + fixity + " operator '" + proto.name + "'",
                          std::to_string(proto.params.size()));
    }

    // Operators are usable from here on, including in their own body.
    if (proto.is_unary_op()) {
        unops_.insert(proto.operator_char());
    } else if (proto.is_binary_op()) {
        binops_.set(proto.operator_char(), proto.precedence.value_or(kDefaultBinaryPrecedence));
    }
    return proto;
}

// -----------------------------
// expressions
// -----------------------------
Result<ExprPtr> Parser::parse_expression() {
    if (auto err = prime()) return *err;
    return parse_expression(0);
}


// Precedence climbing: fold operators binding at least as tight as min_prec,
// right operands climb to prec + 1 so equal precedence associates left.
Result<ExprPtr> Parser::parse_expression(int min_prec) {
    auto lhs = parse_unary();
    if (!lhs) return lhs.error();
    ExprPtr result = std::move(lhs.value());

    for (;;) {
        auto prec = binary_precedence(cur_);
        if (!prec || *prec < min_prec) return result;

        Token op = cur_;
        if (auto err = consume()) return *err;

        auto rhs = parse_expression(*prec + 1);
        if (!rhs) return rhs.error();
        result = std::make_unique<BinaryExpr>(op.op, std::move(result), std::move(rhs.value()), op.pos);
    }
}

// unary ::= primary | UNOP unary
Result<ExprPtr> Parser::parse_unary() {
    DepthGuard guard(depth_);
    if (depth_ > kMaxNestingDepth) {
        return ParseError(ParseErrorKind::NestingTooDeep, cur_.pos,
                          "at most " + std::to_string(kMaxNestingDepth) + " levels", describe(cur_));
    }

    if (cur_.kind != TokKind::Op || !is_unary_operator(cur_.op)) return parse_primary();

    Token op = cur_;
    if (auto err = consume()) return *err;
    auto operand = parse_unary();
    if (!operand) return operand.error();
    return std::make_unique<UnaryExpr>(op.op, std::move(operand.value()), op.pos);
}

Result<ExprPtr> Parser::parse_primary() {
    switch (cur_.kind) {
        case TokKind::Ident:
            return parse_identifier_expr();
        case TokKind::Number:
            return parse_number_expr();
        case TokKind::Op:
            if (cur_.op == '(') return parse_paren_expr();
            break;
        case TokKind::Keyword:
            switch (cur_.keyword) {
                case Keyword::If:  return parse_if_expr();
                case Keyword::For: return parse_for_expr();
                case Keyword::Var: return parse_var_expr();
                default: break;
            }
            break;
        case TokKind::End:
            break;
    }
    return ParseError(ParseErrorKind::ExpectedExpression, cur_.pos, "expression", describe(cur_));
}

Result<ExprPtr> Parser::parse_number_expr() {
    auto e = std::make_unique<NumberExpr>(cur_.number, cur_.pos);
    if (auto err = consume()) return *err;
    return e;
}

// parenexpr ::= '(' expression ')'
Result<ExprPtr> Parser::parse_paren_expr() {
    if (auto err = consume()) return *err;
    auto e = parse_expression(0);
    if (!e) return e.error();
    if (auto err = expect_op(')', ParseErrorKind::MissingTerminator)) return *err;
    return std::move(e.value());
}

// identifierexpr ::= id | id '(' (expression (',' expression)*)? ')'
Result<ExprPtr> Parser::parse_identifier_expr() {
    std::string name = cur_.text;
    SourcePos pos = cur_.pos;
    if (auto err = consume()) return *err;

    if (!cur_.is_op('(')) return std::make_unique<VariableExpr>(std::move(name), pos);
    if (auto err = consume()) return *err;

    std::vector<ExprPtr> args;
    if (!cur_.is_op(')')) {
        for (;;) {
            auto arg = parse_expression(0);
            if (!arg) return arg.error();
            args.push_back(std::move(arg.value()));

            if (cur_.is_op(')')) break;
            if (!cur_.is_op(',')) {
                return unexpected(ParseErrorKind::MissingTerminator, "',' or ')' in argument list");
            }
            if (auto err = consume()) return *err;
        }
    }
    if (auto err = consume()) return *err; // ')'

    return std::make_unique<CallExpr>(std::move(name), std::move(args), pos);
}

// ifexpr ::= 'if' expression 'then' expression 'else' expression
Result<ExprPtr> Parser::parse_if_expr() {
    SourcePos pos = cur_.pos;
    if (auto err = consume()) return *err;

    auto cond = parse_expression(0);
    if (!cond) return cond.error();
    if (auto err = expect_keyword(Keyword::Then)) return *err;
    auto then_branch = parse_expression(0);
    if (!then_branch) return then_branch.error();
    if (auto err = expect_keyword(Keyword::Else)) return *err;
    auto else_branch = parse_expression(0);
    if (!else_branch) return else_branch.error();

    return std::make_unique<IfExpr>(std::move(cond.value()), std::move(then_branch.value()),
                                    std::move(else_branch.value()), pos);
}

// forexpr ::= 'for' id '=' expression ',' expression (',' expression)? 'in' expression
Result<ExprPtr> Parser::parse_for_expr() {
    SourcePos pos = cur_.pos;
    if (auto err = consume()) return *err;

    auto var = expect_ident("identifier after 'for'");
    if (!var) return var.error();
    if (auto err = expect_op('=', ParseErrorKind::UnexpectedToken)) return *err;

    auto start = parse_expression(0);
    if (!start) return start.error();
    if (auto err = expect_op(',', ParseErrorKind::UnexpectedToken)) return *err;
    auto end = parse_expression(0);
    if (!end) return end.error();

    ExprPtr step;
    if (cur_.is_op(',')) {
        if (auto err = consume()) return *err;
        auto s = parse_expression(0);
        if (!s) return s.error();
        step = std::move(s.value());
    }

    if (auto err = expect_keyword(Keyword::In)) return *err;
    auto body = parse_expression(0);
    if (!body) return body.error();

    return std::make_unique<ForExpr>(std::move(var.value()), std::move(start.value()), std::move(end.value()),
                                     std::move(step), std::move(body.value()), pos);
}

// varexpr ::= 'var' id '=' expression (',' id '=' expression)* 'in' expression
Result<ExprPtr> Parser::parse_var_expr() {
    SourcePos pos = cur_.pos;
    if (auto err = consume()) return *err;

    std::vector<VarExpr::Binding> bindings;
    for (;;) {
        auto name = expect_ident("identifier in 'var' binding");
        if (!name) return name.error();
        if (auto err = expect_op('=', ParseErrorKind::UnexpectedToken)) return *err;
        auto init = parse_expression(0);
        if (!init) return init.error();
        bindings.emplace_back(std::move(name.value()), std::move(init.value()));

        if (!cur_.is_op(',')) break;
        if (auto err = consume()) return *err;
    }

    if (auto err = expect_keyword(Keyword::In)) return *err;
    auto body = parse_expression(0);
    if (!body) return body.error();

    return std::make_unique<VarExpr>(std::move(bindings), std::move(body.value()), pos);
}

// -----------------------------
// whole sources
// -----------------------------
Result<Program> parse_program(std::string_view source) {
    Parser parser(source);
    Program program;
    for (;;) {
        auto item = parser.next_item();
        if (!item) return item.error();
        if (!item.value()) return program;
        program.push_back(std::move(*item.value()));
    }
}

ParseReport parse_recovering(std::string_view source) {
    Parser parser(source);
    ParseReport report;
    for (;;) {
        auto item = parser.next_item();
        if (!item) {
            report.errors.push_back(item.error());
            parser.synchronize();
            continue;
        }
        if (!item.value()) return report;
        report.items.push_back(std::move(*item.value()));
    }
}

Program parse(std::string_view source) {
    auto program = parse_program(source);
    if (!program) throw program.error();
    return std::move(program.value());
}

} // namespace kscope
