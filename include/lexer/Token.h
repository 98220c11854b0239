/**
 * Name: pyrite::lex::Token
 * Purpose: Token structure with source span, original text and decoded payload.
 */
#pragma once

#include <string>
#include <variant>
#include <vector>
#include "lexer/TokenKind.h"
#include "pyrite/support/big_int.h"

namespace pyrite::lex {

// Prefix and quoting of a string literal
struct StringFlags {
    bool raw{false};
    bool bytes{false};
    bool format{false};
    bool triple{false};
    char quote{'\''};
};

struct StringPayload {
    std::string value{}; // decoded text (UTF-8) or raw bytes for Bytes tokens
    StringFlags flags{};
};

// One segment of an f-string: literal text or an embedded {expression}
struct FStringPart {
    bool isExpr{false};
    std::string text{}; // decoded literal text, or expression source
    int line{1}; // position of text in the enclosing file
    int col{1};
    char conversion{0}; // 'r', 's', 'a' or 0
    bool selfDocumenting{false}; // {expr=}
    std::string selfDocText{}; // source text echoed by {expr=}, including '='
    std::vector<FStringPart> spec{}; // format spec after ':'
};

struct FStringPayload {
    std::vector<FStringPart> parts{};
    StringFlags flags{};
};

// Int -> BigInt, Float -> double, Imag -> double (imaginary part)
using TokenValue = std::variant<std::monostate, support::BigInt, double, StringPayload, FStringPayload>;

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // original lexeme
    std::string file{};
    int line{1}; // 1-based line number
    int col{1}; // 1-based column at token start
    int endLine{1};
    int endCol{1}; // exclusive
    TokenValue value{};
};

} // namespace pyrite::lex
