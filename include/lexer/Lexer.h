/**
 * Name: Lexer headers umbrella
 * Purpose: Provide a stable include that aggregates single-declaration headers.
 */
#pragma once

#include <string>
#include <vector>
#include "lexer/TokenKind.h"
#include "lexer/Token.h"
#include "lexer/LexError.h"
#include "lexer/LexerOptions.h"
#include "lexer/ITokenStream.h"
#include "lexer/LexerDecl.h"

namespace pyrite::lex {

struct LexResult {
    std::vector<Token> tokens; // terminated by End
    std::vector<LexError> errors;
};

// One-shot convenience: tokenize a buffer.
LexResult tokenize(const std::string& source, const std::string& file, LexerOptions options = {});

} // namespace pyrite::lex
