#include "kscope/lexer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace kscope {

static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

char Lexer::advance() {
    char c = s_[i_++];
    if (c == '\n') {
        ++pos_.line;
        pos_.column = 1;
    } else {
        ++pos_.column;
    }
    return c;
}

void Lexer::skip_ws_and_comments() {
    while (!is_end()) {
        char c = peek();
        if (std::isspace(static_cast<unsigned char>(c))) {
            advance();
        } else if (c == '#') {
            // the newline is left for the whitespace branch
            while (!is_end() && peek() != '\n') advance();
        } else {
            break;
        }
    }
}

LexResult Lexer::next() {
    skip_ws_and_comments();
    SourcePos start = pos_;

    if (is_end()) {
        Token t{TokKind::End};
        t.pos = start;
        return t;
    }

    char c = peek();

    if (is_ident_start(c)) return lex_word(start);

    if (is_digit(c) || (c == '.' && is_digit(peek(1)))) return lex_number(start);

    advance();
    if (std::ispunct(static_cast<unsigned char>(c))) {
        Token t{TokKind::Op};
        t.op = c;
        t.text = std::string(1, c);
        t.pos = start;
        return t;
    }

    return LexicalError(LexErrorKind::UnexpectedCharacter, start, std::string(1, c));
}

Token Lexer::lex_word(SourcePos start) {
    std::size_t begin = i_;
    while (!is_end() && is_ident_char(peek())) advance();

    Token t{TokKind::Ident};
    t.text = std::string(s_.substr(begin, i_ - begin));
    t.pos = start;
    if (auto kw = lookup_keyword(t.text)) {
        t.kind = TokKind::Keyword;
        t.keyword = *kw;
    }
    return t;
}

LexResult Lexer::lex_number(SourcePos start) {
    std::size_t begin = i_;
    while (!is_end() && (is_digit(peek()) || peek() == '.')) advance();

    std::string text(s_.substr(begin, i_ - begin));
    if (std::count(text.begin(), text.end(), '.') > 1) {
        return LexicalError(LexErrorKind::InvalidNumber, start, text);
    }

    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return LexicalError(LexErrorKind::InvalidNumber, start, text);
    }

    Token t{TokKind::Number};
    t.number = v;
    t.text = std::move(text);
    t.pos = start;
    return t;
}

} // namespace kscope
