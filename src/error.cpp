#include "kscope/error.hpp"
#include <cctype>
#include <cstdio>
#include <sstream>
#include <utility>

namespace kscope {

const char* to_string(LexErrorKind k) {
    switch (k) {
        case LexErrorKind::InvalidNumber:       return "invalid number";
        case LexErrorKind::UnexpectedCharacter: return "unexpected character";
    }
    return "lexical error";
}

const char* to_string(ParseErrorKind k) {
    switch (k) {
        case ParseErrorKind::UnexpectedToken:            return "unexpected token";
        case ParseErrorKind::ExpectedExpression:         return "expected expression";
        case ParseErrorKind::UnknownOperator:            return "unknown operator";
        case ParseErrorKind::MissingTerminator:          return "missing terminator";
        case ParseErrorKind::InvalidOperatorDeclaration: return "invalid operator declaration";
        case ParseErrorKind::NestingTooDeep:             return "nesting too deep";
        case ParseErrorKind::Lexical:                    return "lexical error";
    }
    return "parse error";
}

static std::string printable(const std::string& text) {
    if (text.size() == 1 && !std::isprint(static_cast<unsigned char>(text[0]))) {
        char buf[8];
        std::snprintf(buf, sizeof buf, "\\x%02x", static_cast<unsigned char>(text[0]));
        return buf;
    }
    return text;
}

static std::string lexical_message(LexErrorKind k, const std::string& text) {
    return std::string(to_string(k)) + " '" + printable(text) + "'";
}

static std::string parse_message(ParseErrorKind k, const std::string& expected, const std::string& found) {
    std::string msg;
    if (k == ParseErrorKind::UnknownOperator) {
        msg = "unknown operator " + found;
        if (!expected.empty()) msg += ", expected " + expected;
        return msg;
    }
    if (k == ParseErrorKind::InvalidOperatorDeclaration) msg = "invalid operator declaration: ";
    if (k == ParseErrorKind::NestingTooDeep) msg = "expression nested too deeply: ";
    msg += "expected " + (expected.empty() ? std::string("expression") : expected);
    if (!found.empty()) msg += ", found " + found;
    return msg;
}

LexicalError::LexicalError(LexErrorKind k, SourcePos p, std::string offending)
    : std::runtime_error(lexical_message(k, offending)), kind(k), pos(p), text(std::move(offending)) {}

ParseError::ParseError(ParseErrorKind k, SourcePos p, std::string expected_what, std::string found_what)
    : std::runtime_error(parse_message(k, expected_what, found_what)),
      kind(k), pos(p), expected(std::move(expected_what)), found(std::move(found_what)) {}

ParseError::ParseError(const LexicalError& cause)
    : std::runtime_error(cause.what()),
      kind(ParseErrorKind::Lexical), pos(cause.pos), found(cause.text), lexical(cause) {}

static std::string source_line(std::string_view source, int line) {
    std::size_t begin = 0;
    for (int l = 1; l < line; ++l) {
        std::size_t nl = source.find('\n', begin);
        if (nl == std::string_view::npos) return {};
        begin = nl + 1;
    }
    std::size_t end = source.find('\n', begin);
    if (end == std::string_view::npos) end = source.size();
    return std::string(source.substr(begin, end - begin));
}

static std::string render(SourcePos pos, const char* what, std::string_view source) {
    std::ostringstream os;
    os << pos.line << ':' << pos.column << ": error: " << what << '\n';
    std::string text = source_line(source, pos.line);
    os << "  " << text << '\n';
    os << "  ";
    // keep tabs so the caret lines up with the echoed line
    for (int i = 1; i < pos.column; ++i) {
        std::size_t idx = static_cast<std::size_t>(i - 1);
        os << (idx < text.size() && text[idx] == '\t' ? '\t' : ' ');
    }
    os << "^\n";
    return os.str();
}

std::string format_diagnostic(const ParseError& e, std::string_view source) {
    return render(e.pos, e.what(), source);
}

std::string format_diagnostic(const LexicalError& e, std::string_view source) {
    return render(e.pos, e.what(), source);
}

} // namespace kscope
