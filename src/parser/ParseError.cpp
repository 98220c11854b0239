/***
 * Name: pyrite::parse::ParseError helpers
 * Purpose: Stable names for error kinds and wrapping of lexical errors.
 */
#include "parser/ParseError.h"

namespace pyrite::parse {

const char* to_string(const ErrorKind kind) {
  switch (kind) {
    case ErrorKind::UnexpectedToken: return "UnexpectedToken";
    case ErrorKind::InvalidSyntax: return "InvalidSyntax";
    case ErrorKind::UnterminatedLiteral: return "UnterminatedLiteral";
    case ErrorKind::InconsistentIndentation: return "InconsistentIndentation";
    case ErrorKind::UnexpectedEof: return "EOF";
  }
  return "InvalidSyntax";
}

ParseError FromLexError(const lex::LexError& error) {
  ParseError out;
  switch (error.kind) {
    case lex::LexErrorKind::UnterminatedLiteral: out.kind = ErrorKind::UnterminatedLiteral; break;
    case lex::LexErrorKind::InconsistentIndentation: out.kind = ErrorKind::InconsistentIndentation; break;
    case lex::LexErrorKind::InvalidSyntax: out.kind = ErrorKind::InvalidSyntax; break;
  }
  out.message = error.message;
  out.file = error.file;
  out.line = error.line;
  out.col = error.col;
  out.lexical = true;
  return out;
}

} // namespace pyrite::parse
