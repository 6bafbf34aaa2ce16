#pragma once
#include <cstddef>
#include <string_view>

#include "kscope/error.hpp"
#include "kscope/result.hpp"
#include "kscope/token.hpp"

namespace kscope {

using LexResult = Result<Token, LexicalError>;

/// Produces tokens on demand from a source buffer that must outlive it.
/// After the single End token every further call returns End again.
class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}
    LexResult next();

private:
    void skip_ws_and_comments();
    char advance();
    bool is_end() const { return i_ >= s_.size(); }
    char peek(std::size_t ahead = 0) const {
        return i_ + ahead < s_.size() ? s_[i_ + ahead] : '\0';
    }

    LexResult lex_number(SourcePos start);
    Token lex_word(SourcePos start);

    std::string_view s_;
    std::size_t i_{0};
    SourcePos pos_{};
};

} // namespace kscope
