/***
 * Name: pyrite::parse::Parser (match statements)
 * Purpose: Parse match/case statements and structural patterns.
 * Theory of Operation:
 *   `match` and `case` are soft keywords: a line starting with the identifier
 *   match is a match statement only when a subject follows and the first
 *   colon outside brackets ends the line. Patterns have their own grammar:
 *     case_pattern := open_seq | as_pattern
 *     as_pattern   := or_pattern ['as' NAME]
 *     or_pattern   := closed ('|' closed)*
 *     closed       := literal | capture | '_' | value | group | sequence
 *                   | mapping | class
 */
#include "parser/Parser.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace pyrite::parse {

using TK = lex::TokenKind;

bool Parser::atMatchStatement() const {
  if (!atSoftKeyword("match")) return false;
  const auto next = peek(1).kind;
  if (!canStartExpression(next) && next != TK::Star) return false;
  int level = 0;
  for (size_t i = pos_ + 1; i < tokens_.size(); ++i) {
    const auto kind = tokens_[i].kind;
    if (kind == TK::Newline || kind == TK::End) return false;
    if (kind == TK::LParen || kind == TK::LBracket || kind == TK::LBrace) ++level;
    if (kind == TK::RParen || kind == TK::RBracket || kind == TK::RBrace) --level;
    if (kind == TK::Colon && level == 0) {
      return i + 1 < tokens_.size() && tokens_[i + 1].kind == TK::Newline;
    }
  }
  return false;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::StmtPtr Parser::parseMatchStmt() {
  const lex::Token& start = get(); // 'match'
  ast::MatchStmt stmt;

  const lex::Token& subjectStart = peek();
  ExprPtr first = parseStarOrNamed();
  if (!first) return nullptr;
  if (at(TK::Comma)) {
    ast::TupleLiteral tuple;
    tuple.elements.push_back(std::move(first));
    while (match(TK::Comma)) {
      if (at(TK::Colon)) break;
      ExprPtr element = parseStarOrNamed();
      if (!element) return nullptr;
      tuple.elements.push_back(std::move(element));
    }
    stmt.subject = ast::makeExpr(std::move(tuple), spanFrom(subjectStart));
  } else if (first->is<ast::Starred>()) {
    errorAt(first->span, ErrorKind::InvalidSyntax, "cannot use starred expression here");
    return nullptr;
  } else {
    stmt.subject = std::move(first);
  }

  if (!expect(TK::Colon, "':'") || !expect(TK::Newline, "newline")) return nullptr;
  if (!at(TK::Indent)) {
    errorAt(peek(), at(TK::End) ? ErrorKind::UnexpectedEof : ErrorKind::InconsistentIndentation,
            "expected an indented block after 'match' statement");
    return nullptr;
  }
  DepthScope scope(depth_);
  if (!checkDepth("too many levels of indentation")) {
    skipIndentedBlock();
    return nullptr;
  }
  (void)get(); // INDENT

  while (!at(TK::Dedent) && !at(TK::End)) {
    if (match(TK::Newline)) continue;
    if (!atSoftKeyword("case")) {
      errorExpected("'case'");
      synchronize();
      continue;
    }
    const size_t before = pos_;
    if (!parseMatchCase(stmt)) {
      if (pos_ == before || !atLineBoundary()) synchronize();
    }
  }
  (void)match(TK::Dedent);
  if (stmt.cases.empty()) return nullptr;
  return ast::makeStmt(std::move(stmt), spanFrom(start));
}

bool Parser::parseMatchCase(ast::MatchStmt& stmt) {
  const lex::Token& kw = get(); // 'case'
  ast::MatchCase c;
  c.pattern = parseCasePatterns();
  if (!c.pattern) return false;
  if (match(TK::If)) {
    c.guard = parseNamedExpr();
    if (!c.guard) return false;
  }
  if (!expect(TK::Colon, "':'") || !parseBlock(c.body, "'case' statement")) return false;
  c.span = spanFrom(kw);
  stmt.cases.push_back(std::move(c));
  return true;
}

ast::PatternPtr Parser::parseCasePatterns() {
  const lex::Token& start = peek();
  PatternPtr first = parseMaybeStarPattern();
  if (!first) return nullptr;
  if (!at(TK::Comma)) {
    if (first->is<ast::PatternStar>()) {
      errorAt(first->span, ErrorKind::InvalidSyntax, "star pattern cannot be used here");
      return nullptr;
    }
    return first;
  }
  ast::PatternSequence seq;
  seq.isList = false;
  seq.elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (at(TK::Colon) || at(TK::If)) break;
    PatternPtr element = parseMaybeStarPattern();
    if (!element) return nullptr;
    seq.elements.push_back(std::move(element));
  }
  if (!checkSequenceStars(seq.elements)) return nullptr;
  return ast::makePattern(std::move(seq), spanFrom(start));
}

ast::PatternPtr Parser::parseMaybeStarPattern() {
  if (!at(TK::Star)) return parseAsPattern();
  const lex::Token& star = get();
  if (!at(TK::Ident)) {
    errorExpected("name");
    return nullptr;
  }
  ast::PatternStar pattern;
  const lex::Token& name = get();
  if (name.text != "_") pattern.name = name.text;
  return ast::makePattern(std::move(pattern), spanFrom(star));
}

ast::PatternPtr Parser::parseAsPattern() {
  const lex::Token& start = peek();
  PatternPtr pattern = parseOrPattern();
  if (!pattern || !match(TK::As)) return pattern;
  if (!at(TK::Ident)) {
    errorExpected("name");
    return nullptr;
  }
  const lex::Token& name = get();
  if (name.text == "_") {
    errorAt(name, ErrorKind::InvalidSyntax, "cannot use '_' as a target");
    return nullptr;
  }
  return ast::makePattern(ast::PatternAs{std::move(pattern), name.text}, spanFrom(start));
}

ast::PatternPtr Parser::parseOrPattern() {
  const lex::Token& start = peek();
  PatternPtr first = parseClosedPattern();
  if (!first || !at(TK::Pipe)) return first;
  ast::PatternOr alternatives;
  alternatives.patterns.push_back(std::move(first));
  while (match(TK::Pipe)) {
    PatternPtr next = parseClosedPattern();
    if (!next) return nullptr;
    alternatives.patterns.push_back(std::move(next));
  }
  return ast::makePattern(std::move(alternatives), spanFrom(start));
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::PatternPtr Parser::parseClosedPattern() {
  DepthScope scope(depth_);
  if (!checkDepth("too many nested parentheses")) return nullptr;

  const lex::Token& start = peek();
  switch (start.kind) {
    case TK::Ident: {
      const auto next = peek(1).kind;
      const bool dotted = next == TK::Dot || next == TK::LParen;
      if (!dotted) {
        (void)get();
        if (start.text == "_") return ast::makePattern(ast::PatternWildcard{}, spanOf(start));
        return ast::makePattern(ast::PatternName{start.text}, spanOf(start));
      }
      ExprPtr value = parseDottedValue();
      if (!value) return nullptr;
      if (at(TK::LParen)) return parseClassPattern(std::move(value), start);
      return ast::makePattern(ast::PatternValue{std::move(value)}, spanFrom(start));
    }
    case TK::Minus:
    case TK::Int:
    case TK::Float:
    case TK::Imag:
    case TK::String:
    case TK::Bytes:
    case TK::FString:
    case TK::None:
    case TK::True:
    case TK::False: {
      ExprPtr value = parseLiteralValue();
      if (!value) return nullptr;
      return ast::makePattern(ast::PatternValue{std::move(value)}, spanFrom(start));
    }
    case TK::LParen: {
      const lex::Token& open = get();
      BracketScope bracket(openBrackets_, pos_ - 1);
      if (match(TK::RParen)) {
        ast::PatternSequence empty;
        empty.isList = false;
        return ast::makePattern(std::move(empty), spanFrom(open));
      }
      PatternPtr first = parseMaybeStarPattern();
      if (!first) return nullptr;
      if (at(TK::RParen) && !first->is<ast::PatternStar>()) {
        (void)get();
        return first; // group
      }
      ast::PatternList elements;
      elements.push_back(std::move(first));
      return parseSequencePattern(open, TK::RParen, std::move(elements));
    }
    case TK::LBracket: {
      const lex::Token& open = get();
      BracketScope bracket(openBrackets_, pos_ - 1);
      return parseSequencePattern(open, TK::RBracket, {});
    }
    case TK::LBrace:
      return parseMappingPattern(get());
    default:
      errorExpected("pattern");
      return nullptr;
  }
}

ast::PatternPtr Parser::parseSequencePattern(const lex::Token& open, const TK closer, ast::PatternList elements) {
  const char* separator = closer == TK::RParen ? "',' or ')'" : "',' or ']'";
  for (;;) {
    if (match(closer)) break;
    if (!elements.empty()) {
      if (!expect(TK::Comma, separator)) return nullptr;
      if (match(closer)) break;
    }
    PatternPtr element = parseMaybeStarPattern();
    if (!element) return nullptr;
    elements.push_back(std::move(element));
  }
  if (!checkSequenceStars(elements)) return nullptr;
  ast::PatternSequence seq;
  seq.isList = closer == TK::RBracket;
  seq.elements = std::move(elements);
  return ast::makePattern(std::move(seq), spanFrom(open));
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::PatternPtr Parser::parseMappingPattern(const lex::Token& open) {
  BracketScope bracket(openBrackets_, pos_ - 1);
  ast::PatternMapping mapping;
  while (!match(TK::RBrace)) {
    if (at(TK::StarStar)) {
      (void)get();
      if (!at(TK::Ident)) {
        errorExpected("name");
        return nullptr;
      }
      mapping.rest = get().text;
      (void)match(TK::Comma);
      if (!at(TK::RBrace)) {
        errorAt(peek(), ErrorKind::InvalidSyntax, "double star pattern must be last in a mapping pattern");
        return nullptr;
      }
      continue;
    }
    ExprPtr key;
    if (at(TK::Ident)) {
      if (peek(1).kind != TK::Dot) {
        errorAt(peek(), ErrorKind::InvalidSyntax, "mapping pattern keys may only match literals and attribute lookups");
        return nullptr;
      }
      key = parseDottedValue();
    } else {
      key = parseLiteralValue();
    }
    if (!key || !expect(TK::Colon, "':'")) return nullptr;
    PatternPtr value = parseAsPattern();
    if (!value) return nullptr;
    mapping.keys.push_back(std::move(key));
    mapping.patterns.push_back(std::move(value));
    if (match(TK::RBrace)) break;
    if (!expect(TK::Comma, "',' or '}'")) return nullptr;
  }
  return ast::makePattern(std::move(mapping), spanFrom(open));
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::PatternPtr Parser::parseClassPattern(ExprPtr cls, const lex::Token& start) {
  (void)get(); // '('
  BracketScope bracket(openBrackets_, pos_ - 1);
  ast::PatternClass pattern;
  pattern.cls = std::move(cls);
  while (!match(TK::RParen)) {
    if (at(TK::Ident) && peek(1).kind == TK::Equal) {
      const lex::Token& name = get();
      (void)get(); // '='
      if (std::find(pattern.kwdNames.begin(), pattern.kwdNames.end(), name.text) != pattern.kwdNames.end()) {
        errorAt(name, ErrorKind::InvalidSyntax, "attribute name repeated in class pattern: " + name.text);
        return nullptr;
      }
      PatternPtr value = parseAsPattern();
      if (!value) return nullptr;
      pattern.kwdNames.push_back(name.text);
      pattern.kwdPatterns.push_back(std::move(value));
    } else {
      if (!pattern.kwdNames.empty()) {
        errorAt(peek(), ErrorKind::InvalidSyntax, "positional patterns follow keyword patterns");
        return nullptr;
      }
      PatternPtr value = parseAsPattern();
      if (!value) return nullptr;
      pattern.args.push_back(std::move(value));
    }
    if (match(TK::RParen)) break;
    if (!expect(TK::Comma, "',' or ')'")) return nullptr;
  }
  return ast::makePattern(std::move(pattern), spanFrom(start));
}

ast::ExprPtr Parser::parseDottedValue() {
  const lex::Token& start = get();
  ExprPtr value = ast::makeExpr(ast::Name{start.text}, spanOf(start));
  while (at(TK::Dot)) {
    (void)get();
    if (!at(TK::Ident)) {
      errorExpected("name");
      return nullptr;
    }
    const lex::Token& attr = get();
    value = ast::makeExpr(ast::Attribute{std::move(value), attr.text}, spanFrom(start));
  }
  return value;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::ExprPtr Parser::parseLiteralValue() {
  const lex::Token& start = peek();
  if (at(TK::String) || at(TK::Bytes) || at(TK::FString)) {
    ExprPtr text = parseStrings();
    if (text && text->is<ast::FStringLiteral>()) {
      errorAt(text->span, ErrorKind::InvalidSyntax, "patterns may only match literals and attribute lookups");
      return nullptr;
    }
    return text;
  }
  if (at(TK::None) || at(TK::True) || at(TK::False)) return parseAtom();

  const bool negative = match(TK::Minus);
  if (!at(TK::Int) && !at(TK::Float) && !at(TK::Imag)) {
    errorExpected(negative ? "number" : "pattern");
    return nullptr;
  }
  ExprPtr number = parseAtom();
  if (!number) return nullptr;
  if (negative) number = ast::makeExpr(ast::Unary{ast::UnaryOperator::Neg, std::move(number)}, spanFrom(start));
  if (!at(TK::Plus) && !at(TK::Minus)) return number;

  // complex literal: real +/- imaginary
  const lex::Token& opTok = get();
  const ast::Expr& real = negative ? *number->as<ast::Unary>().operand : *number;
  const auto* realConst = real.getIf<ast::Constant>();
  if (!realConst || realConst->kind == ast::Constant::Kind::Imag) {
    errorAt(number->span, ErrorKind::InvalidSyntax, "real number required in complex literal");
    return nullptr;
  }
  if (!at(TK::Imag)) {
    errorAt(peek(), ErrorKind::InvalidSyntax, "imaginary number required in complex literal");
    return nullptr;
  }
  ExprPtr imag = parseAtom();
  if (!imag) return nullptr;
  const auto op = opTok.kind == TK::Plus ? ast::BinaryOperator::Add : ast::BinaryOperator::Sub;
  return ast::makeExpr(ast::Binary{std::move(number), op, std::move(imag)}, spanFrom(start));
}

bool Parser::checkSequenceStars(const ast::PatternList& elements) {
  bool seen = false;
  for (const auto& element : elements) {
    if (!element->is<ast::PatternStar>()) continue;
    if (seen) {
      errorAt(element->span, ErrorKind::InvalidSyntax, "multiple starred names in sequence pattern");
      return false;
    }
    seen = true;
  }
  return true;
}

} // namespace pyrite::parse
