/**
 * Name: pyrite::lex::LexerOptions
 * Purpose: Lexer configuration.
 */
#pragma once

namespace pyrite::lex {

struct LexerOptions {
    int tabWidth{8}; // tab stops used to measure indentation
    int startLine{1}; // position of the first character (for embedded sources)
    int startCol{1};
    // Scan as if inside brackets: no NEWLINE/INDENT/DEDENT. Used for f-string segments.
    bool implicitJoin{false};
};

} // namespace pyrite::lex
