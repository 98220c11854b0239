/***
 * Name: pyrite::parse::ParseError
 * Purpose: Structured diagnostic produced by the parser (lexical errors are
 *   wrapped into the same type so callers see one ordered list).
 */
#pragma once

#include <string>
#include "lexer/LexError.h"

namespace pyrite::parse {

enum class ErrorKind {
  UnexpectedToken,
  InvalidSyntax,
  UnterminatedLiteral,
  InconsistentIndentation,
  UnexpectedEof // reported as "EOF"
};

struct ParseError {
  ErrorKind kind{ErrorKind::InvalidSyntax};
  std::string message{};
  std::string expected{}; // what the grammar wanted, e.g. "':'"; may be empty
  std::string found{}; // offending token text or kind; may be empty
  std::string file{};
  int line{1};
  int col{1};
  bool lexical{false}; // wraps a lex::LexError
};

const char* to_string(ErrorKind kind);

// Wrap a lexical error for the unified error list.
ParseError FromLexError(const lex::LexError& error);

} // namespace pyrite::parse
