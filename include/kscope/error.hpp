#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "kscope/token.hpp"

namespace kscope {

enum class LexErrorKind {
    InvalidNumber,
    UnexpectedCharacter,
};

enum class ParseErrorKind {
    UnexpectedToken,
    ExpectedExpression,
    UnknownOperator,
    MissingTerminator,
    InvalidOperatorDeclaration,
    NestingTooDeep,
    Lexical,    // a LexicalError surfaced while consuming a token
};

const char* to_string(LexErrorKind k);
const char* to_string(ParseErrorKind k);

struct LexicalError : std::runtime_error {
    LexicalError(LexErrorKind k, SourcePos p, std::string offending);

    LexErrorKind kind;
    SourcePos pos;
    std::string text; // the malformed number, or the single unexpected character
};

struct ParseError : std::runtime_error {
    ParseError(ParseErrorKind k, SourcePos p, std::string expected_what, std::string found_what);
    explicit ParseError(const LexicalError& cause);

    ParseErrorKind kind;
    SourcePos pos;
    std::string expected; // empty when the kind alone says it (ExpectedExpression, Lexical)
    std::string found;
    std::optional<LexicalError> lexical{};
};

/// Renders "line:col: error: message" followed by the source line and a caret
/// under the offending column.
std::string format_diagnostic(const ParseError& e, std::string_view source);
std::string format_diagnostic(const LexicalError& e, std::string_view source);

} // namespace kscope
