#include "kscope/token.hpp"
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace kscope {

namespace {

struct KeywordEntry {
    const char* spelling;
    Keyword keyword;
};

constexpr KeywordEntry kKeywords[] = {
    {"def", Keyword::Def},
    {"extern", Keyword::Extern},
    {"if", Keyword::If},
    {"then", Keyword::Then},
    {"else", Keyword::Else},
    {"for", Keyword::For},
    {"in", Keyword::In},
    {"var", Keyword::Var},
    {"binary", Keyword::Binary},
    {"unary", Keyword::Unary},
};

} // namespace

const char* keyword_spelling(Keyword k) {
    for (const auto& e : kKeywords) {
        if (e.keyword == k) return e.spelling;
    }
    return "?";
}

std::optional<Keyword> lookup_keyword(std::string_view word) {
    for (const auto& e : kKeywords) {
        if (word == e.spelling) return e.keyword;
    }
    return std::nullopt;
}

bool operator==(const Token& a, const Token& b) {
    if (a.kind != b.kind || a.pos != b.pos) return false;
    switch (a.kind) {
        case TokKind::End:     return true;
        case TokKind::Ident:   return a.text == b.text;
        case TokKind::Number:  return a.number == b.number && a.text == b.text;
        case TokKind::Keyword: return a.keyword == b.keyword;
        case TokKind::Op:      return a.op == b.op;
    }
    return false;
}

std::string format_number(double v) {
    std::ostringstream os;
    os << std::setprecision(std::numeric_limits<double>::digits10) << v;
    std::string s = os.str();
    if (std::strtod(s.c_str(), nullptr) == v) return s;

    os.str("");
    os << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
    return os.str();
}

std::string describe(const Token& t) {
    switch (t.kind) {
        case TokKind::End:
            return "end of input";
        case TokKind::Ident:
            return "identifier '" + t.text + "'";
        case TokKind::Number:
            return "number " + format_number(t.number);
        case TokKind::Keyword:
            return std::string("keyword '") + keyword_spelling(t.keyword) + "'";
        case TokKind::Op:
            return std::string("'") + t.op + "'";
    }
    return "token";
}

} // namespace kscope
