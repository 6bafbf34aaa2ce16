#pragma once
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "kscope/ast.hpp"
#include "kscope/error.hpp"
#include "kscope/lexer.hpp"
#include "kscope/precedence.hpp"
#include "kscope/result.hpp"

namespace kscope {

/// Recursive descent parser with one token of lookahead. Binary operators are
/// parsed by precedence climbing over a table owned by this instance, so
/// operator declarations never leak between parsers.
class Parser {
public:
    explicit Parser(std::string_view source) : lex_(source) {}
    explicit Parser(Lexer lexer) : lex_(lexer) {}

    /// Next top-level item, or std::nullopt at end of input. Empty statements
    /// are skipped and every item must be followed by ';'.
    Result<std::optional<Item>> next_item();

    // Single productions, without the ';' terminator.
    Result<Function> parse_definition();
    Result<Prototype> parse_extern();
    Result<Function> parse_top_level_expr();
    Result<ExprPtr> parse_expression();

    /// Discards tokens (and lexical errors) until the lookahead is ';' or the
    /// end of input, so a driver can carry on after a failed item.
    void synchronize();

    const Token& current() const { return cur_; }
    const PrecedenceTable& precedences() const { return binops_; }
    bool is_unary_operator(char c) const { return unops_.count(c) != 0; }

private:
    // Parser state a failed item must not leave behind.
    struct Checkpoint {
        PrecedenceTable binops;
        std::set<char> unops;
        int anon_count;
    };
    Checkpoint checkpoint() const { return Checkpoint{binops_, unops_, anon_count_}; }
    void rollback(Checkpoint c);

    std::optional<ParseError> consume();
    std::optional<ParseError> prime();

    Result<ExprPtr> parse_expression(int min_prec);
    Result<ExprPtr> parse_unary();
    Result<ExprPtr> parse_primary();
    Result<ExprPtr> parse_number_expr();
    Result<ExprPtr> parse_paren_expr();
    Result<ExprPtr> parse_identifier_expr();
    Result<ExprPtr> parse_if_expr();
    Result<ExprPtr> parse_for_expr();
    Result<ExprPtr> parse_var_expr();
    Result<Prototype> parse_prototype();

    std::optional<int> binary_precedence(const Token& t) const;
    bool is_known_operator(char c) const;

    // Error for a lookahead that is not what the grammar needs here. An
    // undeclared operator symbol is reported as UnknownOperator.
    ParseError unexpected(ParseErrorKind kind, std::string expected) const;
    std::optional<ParseError> expect_op(char c, ParseErrorKind kind);
    std::optional<ParseError> expect_keyword(Keyword k);
    Result<std::string> expect_ident(const char* what);

    Lexer lex_;
    Token cur_{};
    bool primed_{false};
    PrecedenceTable binops_{};
    std::set<char> unops_{};
    int anon_count_{0};
    int depth_{0};
};

/// Parses a whole source text with a fresh parser, stopping at the first error.
Result<Program> parse_program(std::string_view source);

struct ParseReport {
    Program items;
    std::vector<ParseError> errors;
};

/// Parses a whole source text, resynchronizing at the next ';' after each
/// error so every broken item is reported.
ParseReport parse_recovering(std::string_view source);

/// Same as parse_program. Throws ParseError on malformed input.
Program parse(std::string_view source);

} // namespace kscope
