#include <gtest/gtest.h>
#include <kscope/ast_printer.hpp>
#include <kscope/parser.hpp>

#include <string>
#include <variant>
#include <vector>

namespace {

static std::string expr(std::string_view src) {
    kscope::Parser p(src);
    auto e = p.parse_expression();
    if (!e) return std::string("error: ") + e.error().what();
    return kscope::to_sexpr(*e.value());
}

// S-expression of every item, or the first error.
static std::string program(std::string_view src) {
    auto prog = kscope::parse_program(src);
    if (!prog) return std::string("error: ") + prog.error().what();
    std::string out;
    for (const auto& item : prog.value()) {
        if (!out.empty()) out += "\n";
        out += kscope::to_sexpr(item);
    }
    return out;
}

static kscope::ParseError error_of(std::string_view src) {
    auto prog = kscope::parse_program(src);
    EXPECT_FALSE(prog.ok()) << "expected a parse error for: " << src;
    if (prog.ok()) return kscope::ParseError(kscope::ParseErrorKind::UnexpectedToken, {}, "", "");
    return prog.error();
}

TEST(Parser, SubtractionIsLeftAssociative) {
    EXPECT_EQ(expr("1 - 2 - 3"), "(- (- 1 2) 3)");
}

TEST(Parser, MultiplicationBindsTighter) {
    EXPECT_EQ(expr("1 + 2 * 3"), "(+ 1 (* 2 3))");
    EXPECT_EQ(expr("1 * 2 + 3"), "(+ (* 1 2) 3)");
    EXPECT_EQ(expr("a < b + c / d"), "(< a (+ b (/ c d)))");
}

TEST(Parser, ParenthesesDoNotSurvive) {
    EXPECT_EQ(expr("(1 + 2) * 3"), "(* (+ 1 2) 3)");
    EXPECT_EQ(expr("((x))"), "x");
}

TEST(Parser, DefinitionWithTwoParameters) {
    kscope::Parser p("def foo(a b) a+b");
    auto fn = p.parse_definition();
    ASSERT_TRUE(fn.ok()) << fn.error().what();

    const auto& proto = fn.value().proto;
    EXPECT_EQ(proto.name, "foo");
    EXPECT_EQ(proto.params, (std::vector<std::string>{"a", "b"}));
    EXPECT_FALSE(proto.is_operator);
    EXPECT_FALSE(proto.precedence.has_value());
    EXPECT_FALSE(fn.value().is_anonymous());
    EXPECT_EQ(kscope::to_sexpr(fn.value()), "(def foo (a b) (+ a b))");
}

TEST(Parser, ExternIsABarePrototype) {
    kscope::Parser p("extern sin(x)");
    auto proto = p.parse_extern();
    ASSERT_TRUE(proto.ok()) << proto.error().what();
    EXPECT_EQ(proto.value().name, "sin");
    EXPECT_EQ(proto.value().params, (std::vector<std::string>{"x"}));
    EXPECT_FALSE(proto.value().is_operator);

    auto prog = kscope::parse_program("extern sin(x);");
    ASSERT_TRUE(prog.ok());
    ASSERT_EQ(prog.value().size(), 1u);
    EXPECT_TRUE(std::holds_alternative<kscope::Prototype>(prog.value()[0]));
    EXPECT_EQ(kscope::to_sexpr(prog.value()[0]), "(extern sin (x))");
}

TEST(Parser, TopLevelExpressionBecomesAnonymousFunction) {
    auto prog = kscope::parse_program("1+1;");
    ASSERT_TRUE(prog.ok()) << prog.error().what();
    ASSERT_EQ(prog.value().size(), 1u);

    const auto* fn = std::get_if<kscope::Function>(&prog.value()[0]);
    ASSERT_NE(fn, nullptr);
    EXPECT_TRUE(fn->is_anonymous());
    EXPECT_TRUE(fn->proto.params.empty());
    EXPECT_EQ(kscope::to_sexpr(*fn->body), "(+ 1 1)");
}

TEST(Parser, AnonymousFunctionsAreNumberedPerParser) {
    EXPECT_EQ(program("1; 2;"), "(def __anon_expr_1 () 1)\n(def __anon_expr_2 () 2)");
    EXPECT_EQ(program("3;"), "(def __anon_expr_1 () 3)");
}

TEST(Parser, EmptyStatementsAreSkipped) {
    EXPECT_EQ(program(""), "");
    EXPECT_EQ(program(";;"), "");
    EXPECT_EQ(program(";; x ;;"), "(def __anon_expr_1 () x)");
}

TEST(Parser, CallArguments) {
    EXPECT_EQ(expr("foo(1, x, 2*3)"), "(call foo 1 x (* 2 3))");
    EXPECT_EQ(expr("foo()"), "(call foo)");
    EXPECT_EQ(expr("f(g(x))"), "(call f (call g x))");
}

TEST(Parser, TrailingCommaInCallIsRejected) {
    auto err = error_of("foo(1,);");
    EXPECT_EQ(err.kind, kscope::ParseErrorKind::ExpectedExpression);
    EXPECT_EQ(err.pos.column, 7);
}

TEST(Parser, MissingCommaInCall) {
    auto err = error_of("foo(1 2);");
    EXPECT_EQ(err.kind, kscope::ParseErrorKind::MissingTerminator);
    EXPECT_EQ(err.found, "number 2");
}

TEST(Parser, IfThenElse) {
    EXPECT_EQ(expr("if x < 3 then 1 else fib(x-1)"), "(if (< x 3) 1 (call fib (- x 1)))");
}

TEST(Parser, MissingElseNamesElse) {
    auto err = error_of("if x then 1;");
    EXPECT_EQ(err.kind, kscope::ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(err.expected, "'else'");
    EXPECT_EQ(err.found, "';'");
    EXPECT_STREQ(err.what(), "expected 'else', found ';'");
}

TEST(Parser, MissingThenNamesThen) {
    auto err = error_of("if x 1 else 2;");
    EXPECT_EQ(err.kind, kscope::ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(err.expected, "'then'");
}

TEST(Parser, ForLoop) {
    kscope::Parser p("for i = 1, i < n in f(i)");
    auto e = p.parse_expression();
    ASSERT_TRUE(e.ok()) << e.error().what();
    EXPECT_EQ(kscope::to_sexpr(*e.value()), "(for (i 1 (< i n)) (call f i))");

    const auto* loop = dynamic_cast<const kscope::ForExpr*>(e.value().get());
    ASSERT_NE(loop, nullptr);
    EXPECT_TRUE(loop->step == nullptr);

    EXPECT_EQ(expr("for i = 0, i < 10, 2 in i"), "(for (i 0 (< i 10) 2) i)");
}

TEST(Parser, ForLoopErrors) {
    EXPECT_EQ(error_of("for 1 = 0, 1 in 2;").expected, "identifier after 'for'");
    EXPECT_EQ(error_of("for i 0, 1 in 2;").expected, "'='");
    EXPECT_EQ(error_of("for i = 0 in 2;").expected, "','");
    EXPECT_EQ(error_of("for i = 0, 1 2;").expected, "'in'");
}

TEST(Parser, VarBindings) {
    EXPECT_EQ(expr("var a = 1, b = a + 1 in a * b"), "(var ((a 1) (b (+ a 1))) (* a b))");
    EXPECT_EQ(expr("var x = 2 in x"), "(var ((x 2)) x)");
}

TEST(Parser, VarErrors) {
    EXPECT_EQ(error_of("var in 1;").kind, kscope::ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(error_of("var a in 1;").expected, "'='");
    EXPECT_EQ(error_of("var a = 1 b = 2 in 1;").expected, "'in'");
}

TEST(Parser, UnmatchedParenIsMissingTerminator) {
    auto err = error_of("(1 + 2;");
    EXPECT_EQ(err.kind, kscope::ParseErrorKind::MissingTerminator);
    EXPECT_EQ(err.expected, "')'");
}

TEST(Parser, MissingSemicolonIsMissingTerminator) {
    auto err = error_of("def f(x) x");
    EXPECT_EQ(err.kind, kscope::ParseErrorKind::MissingTerminator);
    EXPECT_EQ(err.expected, "';'");
    EXPECT_EQ(err.found, "end of input");
}

TEST(Parser, NothingAtPrimaryPositionIsExpectedExpression) {
    EXPECT_EQ(error_of("1 + ;").kind, kscope::ParseErrorKind::ExpectedExpression);
    EXPECT_EQ(error_of("then;").kind, kscope::ParseErrorKind::ExpectedExpression);
    EXPECT_EQ(error_of("def f(x) ;").kind, kscope::ParseErrorKind::ExpectedExpression);
}

TEST(Parser, CustomBinaryOperatorRespectsItsPrecedence) {
    EXPECT_EQ(program("def binary| 10 (a b) a; 1 | 2 | 3;"),
              "(def binary| 10 (a b) a)\n(def __anon_expr_1 () (| (| 1 2) 3))");
    // same precedence as '<': left to right
    EXPECT_EQ(program("def binary| 10 (a b) a; 1 | 2 < 3 | 4;"),
              "(def binary| 10 (a b) a)\n(def __anon_expr_1 () (| (< (| 1 2) 3) 4))");
    EXPECT_EQ(program("def binary| 10 (a b) a; 1 + 2 | 3 * 4;"),
              "(def binary| 10 (a b) a)\n(def __anon_expr_1 () (| (+ 1 2) (* 3 4)))");
}

TEST(Parser, UndeclaredOperatorIsUnknown) {
    auto err = error_of("1 | 2;");
    EXPECT_EQ(err.kind, kscope::ParseErrorKind::UnknownOperator);
    EXPECT_EQ(err.pos.column, 3);
    EXPECT_STREQ(err.what(), "unknown operator '|', expected ';'");
}

TEST(Parser, OperatorMustBeDeclaredBeforeUse) {
    EXPECT_EQ(error_of("1 | 2; def binary| 5 (a b) a;").kind, kscope::ParseErrorKind::UnknownOperator);
}

TEST(Parser, BinaryWithoutPrecedenceGetsDefault) {
    kscope::Parser p("def binary& (a b) a");
    auto fn = p.parse_definition();
    ASSERT_TRUE(fn.ok()) << fn.error().what();
    EXPECT_TRUE(fn.value().proto.is_binary_op());
    EXPECT_FALSE(fn.value().proto.precedence.has_value());
    EXPECT_EQ(p.precedences().lookup('&').value_or(-1), kscope::kDefaultBinaryPrecedence);
    EXPECT_EQ(fn.value().proto.symbol_name(), "binary&");
}

TEST(Parser, RedeclaringBuiltinOverwritesPrecedence) {
    EXPECT_EQ(program("def binary+ 50 (a b) a; 1 * 2 + 3;"),
              "(def binary+ 50 (a b) a)\n(def __anon_expr_1 () (* 1 (+ 2 3)))");
}

TEST(Parser, ExternOperatorDeclaresIt) {
    EXPECT_EQ(program("extern binary~ 15 (a b); a ~ b;"),
              "(extern binary~ 15 (a b))\n(def __anon_expr_1 () (~ a b))");
}

TEST(Parser, OperatorMayBeUsedInItsOwnBody) {
    EXPECT_EQ(program("def binary% 50 (a b) if b < 1 then a else a % (b - 1);"),
              "(def binary% 50 (a b) (if (< b 1) a (% a (- b 1))))");
}

TEST(Parser, UnaryOperators) {
    EXPECT_EQ(program("def unary!(v) if v then 0 else 1; !1 + 2; !!x;"),
              "(def unary! (v) (if v 0 1))\n"
              "(def __anon_expr_1 () (+ (! 1) 2))\n"
              "(def __anon_expr_2 () (! (! x)))");
    EXPECT_EQ(program("def unary-(v) 0-v; -1 - -2;"),
              "(def unary- (v) (- 0 v))\n(def __anon_expr_1 () (- (- 1) (- 2)))");
}

TEST(Parser, UndeclaredUnaryIsNotAnExpression) {
    EXPECT_EQ(error_of("!1;").kind, kscope::ParseErrorKind::ExpectedExpression);
    EXPECT_EQ(error_of("-1;").kind, kscope::ParseErrorKind::ExpectedExpression);
}

TEST(Parser, InvalidOperatorDeclarations) {
    for (const char* src : {
             "def unary!(a b) a;",
             "def unary!() 1;",
             "def binary| 5 (a) a;",
             "def binary| 5 (a b c) a;",
             "def binary| 0 (a b) a;",
             "def binary| 101 (a b) a;",
             "def binary| 2.5 (a b) a;",
             "def binary foo (a b) a;",
             "def binary( 5 (a b) a;",
             "def unary; (a) a;",
         }) {
        EXPECT_EQ(error_of(src).kind, kscope::ParseErrorKind::InvalidOperatorDeclaration) << src;
    }
}

TEST(Parser, RejectedDeclarationRegistersNothing) {
    kscope::Parser p("def binary| 5 (a) a");
    EXPECT_FALSE(p.parse_definition().ok());
    EXPECT_FALSE(p.precedences().contains('|'));
}

TEST(Parser, FailedBodyUndoesTheDeclaration) {
    kscope::Parser binary("def binary| 5 (a b) a +");
    EXPECT_FALSE(binary.parse_definition().ok());
    EXPECT_FALSE(binary.precedences().contains('|'));

    kscope::Parser unary("def unary!(v) v +");
    EXPECT_FALSE(unary.parse_definition().ok());
    EXPECT_FALSE(unary.is_unary_operator('!'));
}

TEST(Parser, RejectedItemLeavesNoOperatorBehind) {
    auto report = kscope::parse_recovering("def binary| 5 (a b) a +; 1 | 2;");
    ASSERT_EQ(report.errors.size(), 2u);
    EXPECT_EQ(report.errors[0].kind, kscope::ParseErrorKind::ExpectedExpression);
    EXPECT_EQ(report.errors[1].kind, kscope::ParseErrorKind::UnknownOperator);
    EXPECT_TRUE(report.items.empty());

    // missing ';' after an otherwise complete definition
    report = kscope::parse_recovering("def binary| 5 (a b) a b; 1 | 2;");
    ASSERT_EQ(report.errors.size(), 2u);
    EXPECT_EQ(report.errors[0].kind, kscope::ParseErrorKind::MissingTerminator);
    EXPECT_EQ(report.errors[1].kind, kscope::ParseErrorKind::UnknownOperator);
}

TEST(Parser, RejectedRedeclarationRestoresBuiltinPrecedence) {
    auto report = kscope::parse_recovering("def binary+ 50 (a b) a +; 1 * 2 + 3;");
    ASSERT_EQ(report.errors.size(), 1u);
    ASSERT_EQ(report.items.size(), 1u);
    EXPECT_EQ(kscope::to_sexpr(report.items[0]), "(def __anon_expr_1 () (+ (* 1 2) 3))");
}

TEST(Parser, RejectedItemDoesNotUseAnAnonymousName) {
    auto report = kscope::parse_recovering("2 ^ 3; 8;");
    ASSERT_EQ(report.errors.size(), 1u);
    ASSERT_EQ(report.items.size(), 1u);
    EXPECT_EQ(kscope::to_sexpr(report.items[0]), "(def __anon_expr_1 () 8)");
}

TEST(Parser, UnaryOnlyOperatorInInfixPositionIsUnknown) {
    auto err = error_of("def unary!(v) v; 1 ! 2;");
    EXPECT_EQ(err.kind, kscope::ParseErrorKind::UnknownOperator);
    EXPECT_EQ(err.found, "'!'");
}

TEST(Parser, DeepParenthesesFailCleanly) {
    auto err = error_of(std::string(200000, '('));
    EXPECT_EQ(err.kind, kscope::ParseErrorKind::NestingTooDeep);
    EXPECT_EQ(err.pos.column, kscope::kMaxNestingDepth + 1);
}

TEST(Parser, DeepUnaryChainFailsCleanly) {
    std::string src = "def unary!(v) v; " + std::string(100000, '!') + "1;";
    EXPECT_EQ(error_of(src).kind, kscope::ParseErrorKind::NestingTooDeep);
}

TEST(Parser, NestingBelowTheLimitParses) {
    const int levels = 200;
    std::string src = std::string(levels, '(') + "1" + std::string(levels, ')') + ";";
    EXPECT_EQ(program(src), "(def __anon_expr_1 () 1)");
}

TEST(Parser, RecoversAfterTooDeepNesting) {
    auto report = kscope::parse_recovering(std::string(1000, '(') + "; 1;");
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0].kind, kscope::ParseErrorKind::NestingTooDeep);
    ASSERT_EQ(report.items.size(), 1u);
}

TEST(Parser, PrototypeErrors) {
    EXPECT_EQ(error_of("def 1(x) x;").expected, "function name in prototype");
    EXPECT_EQ(error_of("def f x) x;").expected, "'('");
    auto err = error_of("def f(x, y) x;");
    EXPECT_EQ(err.kind, kscope::ParseErrorKind::MissingTerminator);
    EXPECT_EQ(err.expected, "identifier or ')'");
}

TEST(Parser, ParsersDoNotShareOperators) {
    kscope::Parser first("def binary| 5 (a b) a;");
    ASSERT_TRUE(first.next_item().ok());
    EXPECT_TRUE(first.precedences().contains('|'));

    kscope::Parser second("1 | 2;");
    EXPECT_FALSE(second.precedences().contains('|'));
    auto item = second.next_item();
    ASSERT_FALSE(item.ok());
    EXPECT_EQ(item.error().kind, kscope::ParseErrorKind::UnknownOperator);
}

TEST(Parser, LexicalErrorIsWrapped) {
    auto err = error_of("1 + 1.2.3;");
    EXPECT_EQ(err.kind, kscope::ParseErrorKind::Lexical);
    ASSERT_TRUE(err.lexical.has_value());
    EXPECT_EQ(err.lexical->kind, kscope::LexErrorKind::InvalidNumber);
    EXPECT_EQ(err.pos.column, 5);
    EXPECT_STREQ(err.what(), "invalid number '1.2.3'");
}

TEST(Parser, NodesCarryPositions) {
    kscope::Parser p("def f(x)\n  x + 1");
    auto fn = p.parse_definition();
    ASSERT_TRUE(fn.ok());
    EXPECT_EQ(fn.value().proto.pos.line, 1);
    EXPECT_EQ(fn.value().proto.pos.column, 5);
    EXPECT_EQ(fn.value().body->pos.line, 2);
    EXPECT_EQ(fn.value().body->pos.column, 5);
}

TEST(Parser, LookaheadIsLeftAtTheFailure) {
    kscope::Parser p("1 + ; 2;");
    auto item = p.next_item();
    ASSERT_FALSE(item.ok());
    EXPECT_TRUE(p.current().is_op(';'));
    EXPECT_EQ(p.current().pos.column, 5);

    p.synchronize();
    auto next = p.next_item();
    ASSERT_TRUE(next.ok());
    ASSERT_TRUE(next.value().has_value());
    EXPECT_EQ(kscope::to_sexpr(*next.value()), "(def __anon_expr_1 () 2)");
}

TEST(Parser, RecoveringReportsEveryBrokenItem) {
    auto report = kscope::parse_recovering("1 +; def f(x) x; 2 ^ 3; extern g(); 4 + 5.6.7; 8;");
    ASSERT_EQ(report.errors.size(), 3u);
    EXPECT_EQ(report.errors[0].kind, kscope::ParseErrorKind::ExpectedExpression);
    EXPECT_EQ(report.errors[1].kind, kscope::ParseErrorKind::UnknownOperator);
    EXPECT_EQ(report.errors[2].kind, kscope::ParseErrorKind::Lexical);

    ASSERT_EQ(report.items.size(), 3u);
    EXPECT_EQ(kscope::to_sexpr(report.items[0]), "(def f (x) x)");
    EXPECT_EQ(kscope::to_sexpr(report.items[1]), "(extern g ())");
    EXPECT_EQ(kscope::to_sexpr(report.items[2]), "(def __anon_expr_1 () 8)");
}

TEST(Parser, RecoveringWithMissingFinalTerminator) {
    auto report = kscope::parse_recovering("def f(x) x; f(1)");
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0].kind, kscope::ParseErrorKind::MissingTerminator);
    EXPECT_EQ(report.items.size(), 1u);
}

TEST(Parser, ThrowingEntryPoint) {
    EXPECT_EQ(kscope::parse("extern sin(x); sin(1);").size(), 2u);
    EXPECT_THROW(kscope::parse("1 +"), kscope::ParseError);
}

} // namespace
