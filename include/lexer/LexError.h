/**
 * Name: pyrite::lex::LexError
 * Purpose: Structured lexical diagnostic accumulated while scanning.
 */
#pragma once

#include <string>

namespace pyrite::lex {

enum class LexErrorKind {
    InvalidSyntax, // malformed literal, bad escape, invalid character
    UnterminatedLiteral, // string without closing quote
    InconsistentIndentation // dedent mismatch or ambiguous tab/space mix
};

struct LexError {
    LexErrorKind kind{LexErrorKind::InvalidSyntax};
    std::string message{};
    std::string file{};
    int line{1};
    int col{1};
};

const char* to_string(LexErrorKind k);

} // namespace pyrite::lex
