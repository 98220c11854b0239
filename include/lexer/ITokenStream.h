/**
 * Name: pyrite::lex::ITokenStream
 * Purpose: Abstract interface for token streams consumed by the parser.
 */
#pragma once

#include <cstddef>
#include <vector>
#include "lexer/LexError.h"
#include "lexer/Token.h"

namespace pyrite::lex {

class ITokenStream {
public:
    virtual ~ITokenStream() = default;

    virtual const Token& peek(size_t k = 0) = 0; // lookahead k (0=current)
    virtual Token next() = 0; // consume next token

    // Lexical errors seen so far; the parser folds them into its own error list
    virtual std::vector<LexError> lexErrors() { return {}; }
};

} // namespace pyrite::lex
