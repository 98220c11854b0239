/***
 * Name: pyrite::parse::Parser (statements)
 * Purpose: Blocks, simple statements and compound statements.
 * Theory of Operation:
 *   Each compound statement parses its header clause, then a block: either
 *   NEWLINE INDENT statements DEDENT, or simple statements on the same line.
 *   A statement parser returns null after recording an error; the enclosing
 *   statement loop resynchronizes unless the failure left the cursor at a
 *   line boundary already.
 */
#include "parser/Parser.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace pyrite::parse {

using TK = lex::TokenKind;

namespace {

ast::BinaryOperator augmentedOperator(const TK kind) {
  switch (kind) {
    case TK::PlusEqual: return ast::BinaryOperator::Add;
    case TK::MinusEqual: return ast::BinaryOperator::Sub;
    case TK::StarEqual: return ast::BinaryOperator::Mul;
    case TK::StarStarEqual: return ast::BinaryOperator::Pow;
    case TK::SlashEqual: return ast::BinaryOperator::Div;
    case TK::SlashSlashEqual: return ast::BinaryOperator::FloorDiv;
    case TK::PercentEqual: return ast::BinaryOperator::Mod;
    case TK::AtEqual: return ast::BinaryOperator::MatMul;
    case TK::AmpEqual: return ast::BinaryOperator::BitAnd;
    case TK::PipeEqual: return ast::BinaryOperator::BitOr;
    case TK::CaretEqual: return ast::BinaryOperator::BitXor;
    case TK::LShiftEqual: return ast::BinaryOperator::LShift;
    default: return ast::BinaryOperator::RShift;
  }
}

} // namespace

bool Parser::parseBlock(ast::StmtList& out, const char* owner) {
  if (!match(TK::Newline)) return parseSimpleStatements(out);
  if (!at(TK::Indent)) {
    errorAt(peek(), at(TK::End) ? ErrorKind::UnexpectedEof : ErrorKind::InconsistentIndentation,
            std::string("expected an indented block after ") + owner);
    return false;
  }
  DepthScope scope(depth_);
  if (!checkDepth("too many levels of indentation")) {
    skipIndentedBlock();
    return false;
  }
  (void)get(); // INDENT
  parseStatementsUntilDedent(out);
  (void)match(TK::Dedent);
  return true;
}

void Parser::parseStatementsUntilDedent(ast::StmtList& out) {
  while (!at(TK::Dedent) && !at(TK::End)) {
    if (match(TK::Newline)) continue;
    if (at(TK::Indent)) {
      errorAt(peek(), ErrorKind::InconsistentIndentation, "unexpected indent");
      skipIndentedBlock();
      continue;
    }
    const size_t before = pos_;
    if (!parseStatement(out)) {
      if (pos_ == before || !atLineBoundary()) synchronize();
    }
  }
}

bool Parser::parseStatement(ast::StmtList& out) {
  auto push = [&out](StmtPtr stmt) {
    if (!stmt) return false;
    out.push_back(std::move(stmt));
    return true;
  };
  const lex::Token& tok = peek();
  switch (tok.kind) {
    case TK::If: return push(parseIfStmt());
    case TK::While: return push(parseWhileStmt());
    case TK::For: return push(parseForStmt(tok, false));
    case TK::Try: return push(parseTryStmt());
    case TK::With: return push(parseWithStmt(tok, false));
    case TK::Def: return push(parseFunctionDef(tok, {}, false));
    case TK::Class: return push(parseClassDef(tok, {}));
    case TK::At: return push(parseDecorated());
    case TK::Async: {
      const auto next = peek(1).kind;
      if (next == TK::Def || next == TK::For || next == TK::With) {
        (void)get();
        if (next == TK::Def) return push(parseFunctionDef(tok, {}, true));
        if (next == TK::For) return push(parseForStmt(tok, true));
        return push(parseWithStmt(tok, true));
      }
      break;
    }
    case TK::Ident:
      if (tok.text == "match" && atMatchStatement()) return push(parseMatchStmt());
      break;
    default:
      break;
  }
  return parseSimpleStatements(out);
}

bool Parser::parseSimpleStatements(ast::StmtList& out) {
  for (;;) {
    StmtPtr stmt = parseSmallStatement();
    if (!stmt) return false;
    out.push_back(std::move(stmt));
    if (!match(TK::Semicolon) || at(TK::Newline)) break;
  }
  if (!at(TK::Newline)) {
    if (!openBrackets_.empty() || at(TK::End)) {
      errorExpected("newline");
    } else {
      errorAt(peek(), ErrorKind::UnexpectedToken, "invalid syntax");
    }
    return false;
  }
  (void)get();
  return true;
}

ast::StmtPtr Parser::parseSmallStatement() {
  const lex::Token& tok = peek();
  switch (tok.kind) {
    case TK::Pass: (void)get(); return ast::makeStmt(ast::PassStmt{}, spanOf(tok));
    case TK::Break: (void)get(); return ast::makeStmt(ast::BreakStmt{}, spanOf(tok));
    case TK::Continue: (void)get(); return ast::makeStmt(ast::ContinueStmt{}, spanOf(tok));
    case TK::Return: return parseReturnStmt();
    case TK::Raise: return parseRaiseStmt();
    case TK::Del: return parseDelStmt();
    case TK::Assert: return parseAssertStmt();
    case TK::Global: return parseNameListStmt(false);
    case TK::Nonlocal: return parseNameListStmt(true);
    case TK::Import: return parseImportStmt();
    case TK::From: return parseImportFromStmt();
    default: break;
  }
  if (!canStartExpression(tok.kind) && tok.kind != TK::Star && tok.kind != TK::Yield) {
    if (tok.kind == TK::End) {
      errorExpected("statement");
    } else {
      errorAt(tok, ErrorKind::UnexpectedToken, "unexpected token " + describe(tok));
    }
    return nullptr;
  }
  return parseExprOrAssignStatement();
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::StmtPtr Parser::parseExprOrAssignStatement() {
  const lex::Token& start = peek();
  auto value = [this]() { return at(TK::Yield) ? parseYieldExpr() : parseStarExpressions(); };
  ExprPtr first = value();
  if (!first) return nullptr;

  if (at(TK::Equal)) {
    ast::ExprList chain;
    chain.push_back(std::move(first));
    while (match(TK::Equal)) {
      ExprPtr next = value();
      if (!next) return nullptr;
      chain.push_back(std::move(next));
    }
    if (lex::isAugAssign(peek().kind)) {
      errorAt(peek(), ErrorKind::InvalidSyntax, "augmented assignment cannot be chained with '='");
      return nullptr;
    }
    if (chain.back()->is<ast::Starred>()) {
      errorAt(chain.back()->span, ErrorKind::InvalidSyntax, "can't use starred expression here");
      return nullptr;
    }
    ast::AssignStmt assign;
    assign.value = std::move(chain.back());
    chain.pop_back();
    for (auto& target : chain) {
      if (!setTarget(*target, ast::ExprContext::Store)) return nullptr;
    }
    assign.targets = std::move(chain);
    return ast::makeStmt(std::move(assign), spanFrom(start));
  }

  if (lex::isAugAssign(peek().kind)) {
    const lex::Token& opTok = get();
    if (!first->is<ast::Name>() && !first->is<ast::Attribute>() && !first->is<ast::Subscript>()) {
      errorAt(first->span, ErrorKind::InvalidSyntax,
              std::string("'") + describeExpr(*first) + "' is an illegal expression for augmented assignment");
      return nullptr;
    }
    (void)setTarget(*first, ast::ExprContext::Store);
    ast::AugAssignStmt aug;
    aug.op = augmentedOperator(opTok.kind);
    aug.value = value();
    if (!aug.value) return nullptr;
    if (at(TK::Equal) || lex::isAugAssign(peek().kind)) {
      errorAt(peek(), ErrorKind::InvalidSyntax, "augmented assignment cannot be chained");
      return nullptr;
    }
    aug.target = std::move(first);
    return ast::makeStmt(std::move(aug), spanFrom(start));
  }

  if (at(TK::Colon)) {
    if (first->is<ast::TupleLiteral>() || first->is<ast::ListLiteral>()) {
      errorAt(first->span, ErrorKind::InvalidSyntax,
              first->is<ast::TupleLiteral>() ? "only single target (not tuple) can be annotated"
                                             : "only single target (not list) can be annotated");
      return nullptr;
    }
    if (!first->is<ast::Name>() && !first->is<ast::Attribute>() && !first->is<ast::Subscript>()) {
      errorAt(first->span, ErrorKind::InvalidSyntax, "illegal target for annotation");
      return nullptr;
    }
    (void)get();
    ast::AnnAssignStmt ann;
    ann.simple = first->is<ast::Name>() && start.kind != TK::LParen;
    (void)setTarget(*first, ast::ExprContext::Store);
    ann.target = std::move(first);
    ann.annotation = parseTest();
    if (!ann.annotation) return nullptr;
    if (match(TK::Equal)) {
      ann.value = value();
      if (!ann.value) return nullptr;
    }
    return ast::makeStmt(std::move(ann), spanFrom(start));
  }

  if (first->is<ast::Starred>()) {
    errorAt(first->span, ErrorKind::InvalidSyntax, "can't use starred expression here");
    return nullptr;
  }
  return ast::makeStmt(ast::ExprStmt{std::move(first)}, spanFrom(start));
}

ast::StmtPtr Parser::parseReturnStmt() {
  const lex::Token& start = get();
  ast::ReturnStmt ret;
  if (canStartExpression(peek().kind) || at(TK::Star)) {
    ret.value = parseStarExpressions();
    if (!ret.value) return nullptr;
  }
  return ast::makeStmt(std::move(ret), spanFrom(start));
}

ast::StmtPtr Parser::parseRaiseStmt() {
  const lex::Token& start = get();
  ast::RaiseStmt raise;
  if (canStartExpression(peek().kind)) {
    raise.exc = parseTest();
    if (!raise.exc) return nullptr;
    if (match(TK::From)) {
      raise.cause = parseTest();
      if (!raise.cause) return nullptr;
    }
  }
  return ast::makeStmt(std::move(raise), spanFrom(start));
}

ast::StmtPtr Parser::parseDelStmt() {
  const lex::Token& start = get();
  ast::DelStmt del;
  do {
    if (!del.targets.empty() && !canStartExpression(peek().kind)) break; // trailing comma
    ExprPtr target = parseBinary(kPrecBitOr);
    if (!target || !setTarget(*target, ast::ExprContext::Del)) return nullptr;
    del.targets.push_back(std::move(target));
  } while (match(TK::Comma));
  return ast::makeStmt(std::move(del), spanFrom(start));
}

ast::StmtPtr Parser::parseAssertStmt() {
  const lex::Token& start = get();
  ast::AssertStmt assertion;
  assertion.test = parseTest();
  if (!assertion.test) return nullptr;
  if (match(TK::Comma)) {
    assertion.msg = parseTest();
    if (!assertion.msg) return nullptr;
  }
  return ast::makeStmt(std::move(assertion), spanFrom(start));
}

ast::StmtPtr Parser::parseNameListStmt(const bool nonlocal) {
  const lex::Token& start = get();
  std::vector<std::string> names;
  do {
    if (!at(TK::Ident)) {
      errorExpected("name");
      return nullptr;
    }
    names.push_back(get().text);
  } while (match(TK::Comma));
  if (nonlocal) return ast::makeStmt(ast::NonlocalStmt{std::move(names)}, spanFrom(start));
  return ast::makeStmt(ast::GlobalStmt{std::move(names)}, spanFrom(start));
}

bool Parser::parseDottedName(std::string& out) {
  if (!at(TK::Ident)) {
    errorExpected("module name");
    return false;
  }
  out = get().text;
  while (match(TK::Dot)) {
    if (!at(TK::Ident)) {
      errorExpected("name");
      return false;
    }
    out += '.';
    out += get().text;
  }
  return true;
}

bool Parser::parseImportAlias(ast::Alias& out, const bool dotted) {
  const lex::Token& start = peek();
  if (dotted) {
    if (!parseDottedName(out.name)) return false;
  } else {
    if (!at(TK::Ident)) {
      errorExpected("name");
      return false;
    }
    out.name = get().text;
  }
  if (match(TK::As)) {
    if (!at(TK::Ident)) {
      errorExpected("name");
      return false;
    }
    out.asName = get().text;
  }
  out.span = spanFrom(start);
  return true;
}

ast::StmtPtr Parser::parseImportStmt() {
  const lex::Token& start = get();
  ast::Import imp;
  do {
    ast::Alias alias;
    if (!parseImportAlias(alias, true)) return nullptr;
    imp.names.push_back(std::move(alias));
  } while (match(TK::Comma));
  return ast::makeStmt(std::move(imp), spanFrom(start));
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::StmtPtr Parser::parseImportFromStmt() {
  const lex::Token& start = get();
  ast::ImportFrom imp;
  // '...' arrives as one Ellipsis token
  while (at(TK::Dot) || at(TK::Ellipsis)) imp.level += get().kind == TK::Dot ? 1 : 3;
  if (at(TK::Ident) || imp.level == 0) {
    if (!parseDottedName(imp.module)) return nullptr;
  }
  if (!expect(TK::Import, "'import'")) return nullptr;
  if (at(TK::Star)) {
    const lex::Token& star = get();
    imp.names.push_back(ast::Alias{"*", {}, spanOf(star)});
    return ast::makeStmt(std::move(imp), spanFrom(start));
  }
  if (at(TK::LParen)) {
    (void)get();
    BracketScope bracket(openBrackets_, pos_ - 1);
    while (!at(TK::RParen)) {
      ast::Alias alias;
      if (!parseImportAlias(alias, false)) return nullptr;
      imp.names.push_back(std::move(alias));
      if (!match(TK::Comma)) break;
    }
    if (!expect(TK::RParen, "',' or ')'")) return nullptr;
    if (imp.names.empty()) {
      errorAt(previous(), ErrorKind::InvalidSyntax, "expected at least one name to import");
      return nullptr;
    }
    return ast::makeStmt(std::move(imp), spanFrom(start));
  }
  do {
    if (!imp.names.empty() && at(TK::Newline)) {
      errorAt(previous(), ErrorKind::InvalidSyntax, "trailing comma not allowed without surrounding parentheses");
      return nullptr;
    }
    ast::Alias alias;
    if (!parseImportAlias(alias, false)) return nullptr;
    imp.names.push_back(std::move(alias));
  } while (match(TK::Comma));
  return ast::makeStmt(std::move(imp), spanFrom(start));
}

ast::StmtPtr Parser::parseIfStmt() {
  struct Arm {
    const lex::Token* start;
    ExprPtr test;
    ast::StmtList body;
  };
  std::vector<Arm> arms;
  do {
    const lex::Token& kw = get(); // 'if' or 'elif'
    Arm arm{&kw, nullptr, {}};
    arm.test = parseNamedExpr();
    if (!arm.test || !expect(TK::Colon, "':'")) return nullptr;
    if (!parseBlock(arm.body, kw.kind == TK::If ? "'if' statement" : "'elif' statement")) return nullptr;
    arms.push_back(std::move(arm));
  } while (at(TK::Elif));

  ast::StmtList orelse;
  if (match(TK::Else)) {
    if (!expect(TK::Colon, "':'") || !parseBlock(orelse, "'else' statement")) return nullptr;
  }
  // elif arms nest inside the orelse of the arm before them
  for (auto it = arms.rbegin(); it != arms.rend(); ++it) {
    ast::IfStmt stmt;
    stmt.test = std::move(it->test);
    stmt.body = std::move(it->body);
    stmt.orelse = std::move(orelse);
    orelse.clear();
    orelse.push_back(ast::makeStmt(std::move(stmt), spanFrom(*it->start)));
  }
  return std::move(orelse.front());
}

ast::StmtPtr Parser::parseWhileStmt() {
  const lex::Token& start = get();
  ast::WhileStmt loop;
  loop.test = parseNamedExpr();
  if (!loop.test || !expect(TK::Colon, "':'")) return nullptr;
  if (!parseBlock(loop.body, "'while' statement")) return nullptr;
  if (match(TK::Else)) {
    if (!expect(TK::Colon, "':'") || !parseBlock(loop.orelse, "'else' statement")) return nullptr;
  }
  return ast::makeStmt(std::move(loop), spanFrom(start));
}

ast::StmtPtr Parser::parseForStmt(const lex::Token& start, const bool isAsync) {
  (void)get(); // 'for'
  ast::ForStmt loop;
  loop.isAsync = isAsync;
  loop.target = parseTargetList();
  if (!loop.target || !setTarget(*loop.target, ast::ExprContext::Store)) return nullptr;
  if (!expect(TK::In, "'in'")) return nullptr;
  loop.iter = parseStarExpressions();
  if (!loop.iter || !expect(TK::Colon, "':'")) return nullptr;
  if (!parseBlock(loop.body, "'for' statement")) return nullptr;
  if (match(TK::Else)) {
    if (!expect(TK::Colon, "':'") || !parseBlock(loop.orelse, "'else' statement")) return nullptr;
  }
  return ast::makeStmt(std::move(loop), spanFrom(start));
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::StmtPtr Parser::parseTryStmt() {
  const lex::Token& start = get();
  ast::TryStmt stmt;
  if (!expect(TK::Colon, "':'") || !parseBlock(stmt.body, "'try' statement")) return nullptr;

  const lex::Token* bareExcept = nullptr;
  while (at(TK::Except)) {
    const lex::Token& kw = get();
    if (bareExcept) {
      errorAt(*bareExcept, ErrorKind::InvalidSyntax, "default 'except:' must be last");
      return nullptr;
    }
    ast::ExceptHandler handler;
    if (!at(TK::Colon)) {
      handler.type = parseTest();
      if (!handler.type) return nullptr;
      if (at(TK::Comma)) {
        errorAt(handler.type->span, ErrorKind::InvalidSyntax, "multiple exception types must be parenthesized");
        return nullptr;
      }
      if (match(TK::As)) {
        if (!at(TK::Ident)) {
          errorExpected("name");
          return nullptr;
        }
        handler.name = get().text;
      }
    } else {
      bareExcept = &kw;
    }
    if (!expect(TK::Colon, "':'") || !parseBlock(handler.body, "'except' statement")) return nullptr;
    handler.span = spanFrom(kw);
    stmt.handlers.push_back(std::move(handler));
  }

  if (at(TK::Else)) {
    if (stmt.handlers.empty()) {
      errorAt(peek(), ErrorKind::InvalidSyntax, "expected 'except' or 'finally' block");
      return nullptr;
    }
    (void)get();
    if (!expect(TK::Colon, "':'") || !parseBlock(stmt.orelse, "'else' statement")) return nullptr;
  }
  bool hasFinally = false;
  if (match(TK::Finally)) {
    hasFinally = true;
    if (!expect(TK::Colon, "':'") || !parseBlock(stmt.finalbody, "'finally' statement")) return nullptr;
  }
  if (stmt.handlers.empty() && !hasFinally) {
    errorAt(peek(), ErrorKind::InvalidSyntax, "expected 'except' or 'finally' block");
    return nullptr;
  }
  return ast::makeStmt(std::move(stmt), spanFrom(start));
}

bool Parser::parseWithItem(std::vector<ast::WithItem>& items) {
  const lex::Token& start = peek();
  ast::WithItem item;
  item.contextExpr = parseTest();
  if (!item.contextExpr) return false;
  if (match(TK::As)) {
    item.optionalVars = parseBinary(kPrecBitOr);
    if (!item.optionalVars || !setTarget(*item.optionalVars, ast::ExprContext::Store)) return false;
  }
  item.span = spanFrom(start);
  items.push_back(std::move(item));
  return true;
}

ast::StmtPtr Parser::parseWithStmt(const lex::Token& start, const bool isAsync) {
  (void)get(); // 'with'
  ast::WithStmt stmt;
  stmt.isAsync = isAsync;

  // with (a as b, c as d): the parenthesized form ends with ')' ':'
  bool parenthesized = false;
  if (at(TK::LParen)) {
    int level = 0;
    for (size_t i = pos_; i < tokens_.size(); ++i) {
      const auto kind = tokens_[i].kind;
      if (kind == TK::LParen || kind == TK::LBracket || kind == TK::LBrace) ++level;
      if (kind == TK::RParen || kind == TK::RBracket || kind == TK::RBrace) --level;
      if (kind == TK::Newline || kind == TK::End) break;
      if (level == 0) {
        parenthesized = i + 1 < tokens_.size() && tokens_[i + 1].kind == TK::Colon;
        break;
      }
    }
  }
  if (parenthesized) {
    (void)get();
    BracketScope bracket(openBrackets_, pos_ - 1);
    while (!at(TK::RParen)) {
      if (!parseWithItem(stmt.items)) return nullptr;
      if (!match(TK::Comma)) break;
    }
    if (!expect(TK::RParen, "',' or ')'")) return nullptr;
  } else {
    do {
      if (!parseWithItem(stmt.items)) return nullptr;
    } while (match(TK::Comma));
  }
  if (stmt.items.empty()) {
    errorAt(previous(), ErrorKind::InvalidSyntax, "expected at least one context manager");
    return nullptr;
  }
  if (!expect(TK::Colon, "':'") || !parseBlock(stmt.body, "'with' statement")) return nullptr;
  return ast::makeStmt(std::move(stmt), spanFrom(start));
}

ast::StmtPtr Parser::parseDecorated() {
  const lex::Token& start = peek();
  ast::ExprList decorators;
  while (match(TK::At)) {
    ExprPtr decorator = parseNamedExpr();
    if (!decorator || !expect(TK::Newline, "newline")) return nullptr;
    decorators.push_back(std::move(decorator));
  }
  if (at(TK::Def)) return parseFunctionDef(start, std::move(decorators), false);
  if (at(TK::Async) && peek(1).kind == TK::Def) {
    (void)get();
    return parseFunctionDef(start, std::move(decorators), true);
  }
  if (at(TK::Class)) return parseClassDef(start, std::move(decorators));
  errorExpected("'def' or 'class' after decorator");
  return nullptr;
}

ast::StmtPtr Parser::parseFunctionDef(const lex::Token& start, ast::ExprList decorators, const bool isAsync) {
  (void)get(); // 'def'
  ast::FunctionDef fn;
  fn.isAsync = isAsync;
  fn.decorators = std::move(decorators);
  if (!at(TK::Ident)) {
    errorExpected("function name");
    return nullptr;
  }
  fn.name = get().text;
  if (!expect(TK::LParen, "'('")) return nullptr;
  {
    BracketScope bracket(openBrackets_, pos_ - 1);
    if (!parseParameters(fn.args, TK::RParen, true) || !expect(TK::RParen, "',' or ')'")) return nullptr;
  }
  if (match(TK::Arrow)) {
    fn.returns = parseTest();
    if (!fn.returns) return nullptr;
  }
  if (!expect(TK::Colon, "':'") || !parseBlock(fn.body, "function definition")) return nullptr;
  return ast::makeStmt(std::move(fn), spanFrom(start));
}

ast::StmtPtr Parser::parseClassDef(const lex::Token& start, ast::ExprList decorators) {
  (void)get(); // 'class'
  ast::ClassDef cls;
  cls.decorators = std::move(decorators);
  if (!at(TK::Ident)) {
    errorExpected("class name");
    return nullptr;
  }
  cls.name = get().text;
  if (match(TK::LParen)) {
    BracketScope bracket(openBrackets_, pos_ - 1);
    if (!parseCallArguments(cls.bases, cls.keywords)) return nullptr;
  }
  if (!expect(TK::Colon, "':'") || !parseBlock(cls.body, "class definition")) return nullptr;
  return ast::makeStmt(std::move(cls), spanFrom(start));
}

bool Parser::parseParam(ast::Param& out, const bool annotations) {
  const lex::Token& start = peek();
  if (!at(TK::Ident)) {
    errorExpected("parameter name");
    return false;
  }
  out.name = get().text;
  if (annotations && match(TK::Colon)) {
    out.annotation = parseTest();
    if (!out.annotation) return false;
  }
  out.span = spanFrom(start);
  return true;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity,readability-function-size)
bool Parser::parseParameters(ast::Arguments& out, const TK closer, const bool annotations) {
  bool seenSlash = false;
  bool seenStar = false;
  bool bareStar = false;
  bool sawDefault = false;
  std::vector<std::string> names;
  auto addName = [&](const ast::Param& p) {
    if (std::find(names.begin(), names.end(), p.name) != names.end()) {
      errorAt(p.span, ErrorKind::InvalidSyntax, "duplicate argument '" + p.name + "' in function definition");
      return false;
    }
    names.push_back(p.name);
    return true;
  };

  while (!at(closer)) {
    const lex::Token& tok = peek();
    if (at(TK::Slash)) {
      if (seenSlash) {
        errorAt(tok, ErrorKind::InvalidSyntax, "/ may appear only once");
        return false;
      }
      if (seenStar) {
        errorAt(tok, ErrorKind::InvalidSyntax, "/ must be ahead of *");
        return false;
      }
      if (out.args.empty()) {
        errorAt(tok, ErrorKind::InvalidSyntax, "at least one argument must precede /");
        return false;
      }
      (void)get();
      seenSlash = true;
      out.posOnly = std::move(out.args);
      out.args.clear();
    } else if (at(TK::Star)) {
      (void)get();
      if (seenStar) {
        errorAt(tok, ErrorKind::InvalidSyntax, "* argument may appear only once");
        return false;
      }
      seenStar = true;
      if (at(TK::Comma) || at(closer)) {
        bareStar = true;
      } else {
        ast::Param p;
        if (!parseParam(p, annotations) || !addName(p)) return false;
        out.varArg = std::move(p);
      }
    } else if (at(TK::StarStar)) {
      (void)get();
      ast::Param p;
      if (!parseParam(p, annotations) || !addName(p)) return false;
      out.kwArg = std::move(p);
      (void)match(TK::Comma);
      if (!at(closer)) {
        errorAt(peek(), ErrorKind::InvalidSyntax, "arguments cannot follow var-keyword argument");
        return false;
      }
      break;
    } else {
      ast::Param p;
      if (!parseParam(p, annotations)) return false;
      if (match(TK::Equal)) {
        p.defaultValue = parseTest();
        if (!p.defaultValue) return false;
      }
      p.span = spanFrom(tok);
      if (!addName(p)) return false;
      if (seenStar) {
        out.kwOnly.push_back(std::move(p));
      } else {
        if (p.defaultValue) {
          sawDefault = true;
        } else if (sawDefault) {
          errorAt(tok, ErrorKind::InvalidSyntax, "non-default argument follows default argument");
          return false;
        }
        out.args.push_back(std::move(p));
      }
    }
    if (!match(TK::Comma)) break;
  }
  if (bareStar && out.kwOnly.empty()) {
    errorAt(peek(), ErrorKind::InvalidSyntax, "named arguments must follow bare *");
    return false;
  }
  return true;
}

} // namespace pyrite::parse
