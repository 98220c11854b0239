/***
 * Name: pyrite::parse::Parser (core)
 * Purpose: Token buffer, diagnostics, recovery and the module/expression
 *   entry points.
 */
#include "parser/Parser.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>
#include "lexer/Lexer.h"

namespace pyrite::parse {

using TK = lex::TokenKind;

namespace {

// Lexical errors in source order, then syntactic ones. Errors from nested
// f-string fields arrive after the outer lexer's, so the lexical run is sorted.
std::vector<ParseError> collectErrors(std::vector<ParseError> lexical, const std::vector<ParseError>& syntactic) {
  std::stable_sort(lexical.begin(), lexical.end(), [](const ParseError& a, const ParseError& b) {
    return a.line != b.line ? a.line < b.line : a.col < b.col;
  });
  lexical.insert(lexical.end(), syntactic.begin(), syntactic.end());
  return lexical;
}

} // namespace

void Parser::initBuffer() {
  if (initialized_) return;
  // Drain the stream; Error tokens only mark spans the lexer already reported
  tokens_.clear();
  for (;;) {
    auto tok = ts_.next();
    const bool end = tok.kind == TK::End;
    if (tok.kind != TK::Error) tokens_.push_back(std::move(tok));
    if (end) break;
  }
  for (const auto& err : ts_.lexErrors()) {
    lexErrors_.push_back(FromLexError(err));
  }
  pos_ = 0;
  initialized_ = true;
}

const lex::Token& Parser::peek(const size_t k) const {
  // Safe in presence of End sentry
  const size_t idx = pos_ + k;
  return tokens_[idx < tokens_.size() ? idx : (tokens_.size() - 1)];
}

const lex::Token& Parser::get() {
  const lex::Token& tok = peek();
  if (pos_ + 1 < tokens_.size()) ++pos_;
  return tok;
}

const lex::Token& Parser::previous() const {
  return tokens_[pos_ > 0 ? pos_ - 1 : 0];
}

bool Parser::match(const TK kind) {
  if (peek().kind == kind) {
    (void)get();
    return true;
  }
  return false;
}

bool Parser::expect(const TK kind, const char* what) {
  if (match(kind)) return true;
  errorExpected(what);
  return false;
}

bool Parser::atSoftKeyword(const char* word, const size_t k) const {
  const auto& tok = peek(k);
  return tok.kind == TK::Ident && tok.text == word;
}

bool Parser::atLayoutEnd() const {
  for (size_t i = pos_; i < tokens_.size(); ++i) {
    const auto kind = tokens_[i].kind;
    if (kind == TK::End) return true;
    if (kind != TK::Newline && kind != TK::Dedent) return false;
  }
  return true;
}

void Parser::addError(const ErrorKind kind, const int line, const int col, std::string message, std::string expected,
                      std::string found) {
  // One diagnostic per position: later ones are usually consequences
  for (const auto& e : errors_) {
    if (e.line == line && e.col == col) return;
  }
  ParseError err;
  err.kind = kind;
  err.message = std::move(message);
  err.expected = std::move(expected);
  err.found = std::move(found);
  err.file = tokens_.empty() ? std::string() : tokens_.front().file;
  err.line = line;
  err.col = col;
  errors_.push_back(std::move(err));
}

void Parser::errorAt(const lex::Token& tok, const ErrorKind kind, std::string message) {
  addError(kind, tok.line, tok.col, std::move(message), {}, describe(tok));
}

void Parser::errorAt(const ast::Span& span, const ErrorKind kind, std::string message) {
  addError(kind, span.line, span.col, std::move(message));
}

void Parser::errorExpected(const char* what) {
  const auto& got = peek();
  if (!openBrackets_.empty() && atLayoutEnd()) {
    // Input ended inside brackets: point at the bracket left open
    const auto& open = tokens_[openBrackets_.back()];
    addError(ErrorKind::UnexpectedEof, open.line, open.col, "'" + open.text + "' was never closed", what,
             describe(got));
    return;
  }
  if (got.kind == TK::End) {
    addError(ErrorKind::UnexpectedEof, got.line, got.col, std::string("unexpected EOF while parsing, expected ") + what,
             what, describe(got));
    return;
  }
  addError(ErrorKind::UnexpectedToken, got.line, got.col, std::string("expected ") + what, what, describe(got));
}

bool Parser::checkDepth(const char* message) {
  if (depth_ <= opts_.maxNestingDepth) return true;
  if (!depthReported_) {
    depthReported_ = true;
    errorAt(peek(), ErrorKind::InvalidSyntax, message);
  }
  return false;
}

std::string Parser::describe(const lex::Token& tok) {
  switch (tok.kind) {
    case TK::End: return "end of file";
    case TK::Newline: return "newline";
    case TK::Indent: return "indent";
    case TK::Dedent: return "dedent";
    default: return "'" + tok.text + "'";
  }
}

void Parser::synchronize() {
  // Delimiter-aware synchronization: balance (), [], {} while skipping ahead.
  int paren = 0;
  int bracket = 0;
  int brace = 0;
  for (;;) {
    const auto& t = peek();
    if (t.kind == TK::End) break;
    if (t.kind == TK::LParen) { ++paren; (void)get(); continue; }
    if (t.kind == TK::RParen) { if (paren > 0) --paren; (void)get(); continue; }
    if (t.kind == TK::LBracket) { ++bracket; (void)get(); continue; }
    if (t.kind == TK::RBracket) { if (bracket > 0) --bracket; (void)get(); continue; }
    if (t.kind == TK::LBrace) { ++brace; (void)get(); continue; }
    if (t.kind == TK::RBrace) { if (brace > 0) --brace; (void)get(); continue; }
    // When not nested inside delimiters, newline/dedent is a good boundary
    if (paren == 0 && bracket == 0 && brace == 0) {
      if (t.kind == TK::Newline || t.kind == TK::Dedent) { break; }
    }
    (void)get();
  }
  if (peek().kind == TK::Newline) {
    (void)get();
    // A block opened by the broken line belongs to it
    if (peek().kind == TK::Indent) skipIndentedBlock();
  }
}

void Parser::skipIndentedBlock() {
  int level = 0;
  while (!at(TK::End)) {
    const auto kind = get().kind;
    if (kind == TK::Indent) ++level;
    if (kind == TK::Dedent && --level == 0) return;
  }
}

bool Parser::atLineBoundary() const {
  if (pos_ == 0) return true;
  const auto kind = previous().kind;
  return kind == TK::Newline || kind == TK::Dedent || at(TK::End);
}

ast::Span Parser::spanOf(const lex::Token& tok) {
  return ast::Span{tok.line, tok.col, tok.endLine, tok.endCol};
}

ast::Span Parser::spanFrom(const lex::Token& first) const {
  const auto& last = previous();
  return ast::Span{first.line, first.col, last.endLine, last.endCol};
}

ast::Span Parser::join(const ast::Span& a, const ast::Span& b) {
  return ast::Span{a.line, a.col, b.endLine, b.endCol};
}

ParseResult Parser::finish(std::unique_ptr<ast::Module> module) {
  ParseResult result;
  result.errors = collectErrors(lexErrors_, errors_);
  if (result.errors.empty()) result.module = std::move(module);
  return result;
}

ParseResult Parser::parseModule() {
  initBuffer();
  auto mod = std::make_unique<ast::Module>();
  mod->file = tokens_.front().file;
  const lex::Token& first = peek();
  while (!at(TK::End)) {
    if (match(TK::Newline)) continue;
    if (at(TK::Indent)) {
      errorAt(peek(), ErrorKind::InconsistentIndentation, "unexpected indent");
      skipIndentedBlock();
      continue;
    }
    if (at(TK::Dedent)) {
      (void)get();
      continue;
    }
    const size_t before = pos_;
    if (!parseStatement(mod->body)) {
      if (pos_ == before || !atLineBoundary()) synchronize();
    }
  }
  mod->span = ast::Span{first.line, first.col, peek().line, peek().col};
  return finish(std::move(mod));
}

ExprResult Parser::parseExpressionInput() {
  initBuffer();
  ExprResult result;
  ExprPtr expr = at(TK::Yield) ? parseYieldExpr() : parseStarExpressions();
  if (expr) {
    // Layout tokens are absent in implicit-join mode but tolerated here
    while (at(TK::Newline) || at(TK::Indent) || at(TK::Dedent)) (void)get();
    if (!at(TK::End)) errorAt(peek(), ErrorKind::UnexpectedToken, "unexpected token " + describe(peek()));
  }
  result.errors = collectErrors(lexErrors_, errors_);
  if (result.errors.empty()) result.expr = std::move(expr);
  return result;
}

} // namespace pyrite::parse
