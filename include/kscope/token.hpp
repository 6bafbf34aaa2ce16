#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace kscope {

// 1-based line and column of the first character of a token or node.
struct SourcePos {
    int line{1};
    int column{1};
};

inline bool operator==(const SourcePos& a, const SourcePos& b) {
    return a.line == b.line && a.column == b.column;
}
inline bool operator!=(const SourcePos& a, const SourcePos& b) { return !(a == b); }

enum class TokKind {
    End,
    Ident,
    Number,
    Keyword,
    Op,     // any single punctuation character, including ( ) , ;
};

enum class Keyword {
    Def,
    Extern,
    If,
    Then,
    Else,
    For,
    In,
    Var,
    Binary,
    Unary,
};

struct Token {
    TokKind kind{TokKind::End};
    std::string text{};            // Ident spelling / Number source text / Keyword spelling
    double number{0.0};            // Number
    Keyword keyword{Keyword::Def}; // Keyword
    char op{'\0'};                 // Op
    SourcePos pos{};

    bool is_op(char c) const { return kind == TokKind::Op && op == c; }
    bool is_keyword(Keyword k) const { return kind == TokKind::Keyword && keyword == k; }
};

bool operator==(const Token& a, const Token& b);
inline bool operator!=(const Token& a, const Token& b) { return !(a == b); }

const char* keyword_spelling(Keyword k);
std::optional<Keyword> lookup_keyword(std::string_view word);

// Shortest of 15 or 17 significant digits that reads back as the same value.
std::string format_number(double v);

/// Short human readable form used in diagnostics, e.g. "identifier 'foo'",
/// "keyword 'then'", "'+'" or "end of input".
std::string describe(const Token& t);

} // namespace kscope
