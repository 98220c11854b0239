/***
 * Name: pyrite::parse::Parser (expressions)
 * Purpose: Expression grammar: operator precedence, primaries and trailers,
 *   displays and comprehensions, call arguments, subscripts, lambda, yield.
 * Theory of Operation:
 *   parseBinary runs an operator/operand stack over the table in
 *   parser/Precedence.h. Comparison chains and boolean operators are N-ary:
 *   a repeated operator of the same level extends the pending entry instead
 *   of opening a new one, so `a < b < c` becomes one Compare node. Only atoms
 *   (brackets), lambda bodies and blocks re-enter the grammar recursively, and
 *   each re-entry is counted against ParserOptions::maxNestingDepth.
 */
#include "parser/Parser.h"

#include <string>
#include <utility>
#include <vector>

namespace pyrite::parse {

using TK = lex::TokenKind;
using ast::BinaryOperator;
using ast::UnaryOperator;

namespace {

enum class OpClass { Binary, Compare, Bool, Prefix };

struct PendingOp {
  OpClass cls{OpClass::Binary};
  int prec{0};
  BinaryOperator binOp{BinaryOperator::Add};
  UnaryOperator unOp{UnaryOperator::Neg};
  std::vector<BinaryOperator> cmpOps{};
  size_t arity{2}; // operands consumed when reduced
  ast::Span start{}; // prefix operator position
};

// Infix operator at the cursor; width is the number of tokens it spans.
bool infixAt(const lex::Token& tok, const lex::Token& next, PendingOp& op, size_t& width) {
  width = 1;
  op.cls = OpClass::Binary;
  switch (tok.kind) {
    case TK::Or: op = PendingOp{OpClass::Bool, kPrecOr, BinaryOperator::Or}; return true;
    case TK::And: op = PendingOp{OpClass::Bool, kPrecAnd, BinaryOperator::And}; return true;
    case TK::Pipe: op.prec = kPrecBitOr; op.binOp = BinaryOperator::BitOr; return true;
    case TK::Caret: op.prec = kPrecBitXor; op.binOp = BinaryOperator::BitXor; return true;
    case TK::Amp: op.prec = kPrecBitAnd; op.binOp = BinaryOperator::BitAnd; return true;
    case TK::LShift: op.prec = kPrecShift; op.binOp = BinaryOperator::LShift; return true;
    case TK::RShift: op.prec = kPrecShift; op.binOp = BinaryOperator::RShift; return true;
    case TK::Plus: op.prec = kPrecArith; op.binOp = BinaryOperator::Add; return true;
    case TK::Minus: op.prec = kPrecArith; op.binOp = BinaryOperator::Sub; return true;
    case TK::Star: op.prec = kPrecTerm; op.binOp = BinaryOperator::Mul; return true;
    case TK::Slash: op.prec = kPrecTerm; op.binOp = BinaryOperator::Div; return true;
    case TK::SlashSlash: op.prec = kPrecTerm; op.binOp = BinaryOperator::FloorDiv; return true;
    case TK::Percent: op.prec = kPrecTerm; op.binOp = BinaryOperator::Mod; return true;
    case TK::At: op.prec = kPrecTerm; op.binOp = BinaryOperator::MatMul; return true;
    case TK::StarStar: op.prec = kPrecPower; op.binOp = BinaryOperator::Pow; return true;
    default: break;
  }
  BinaryOperator cmp{};
  switch (tok.kind) {
    case TK::Lt: cmp = BinaryOperator::Lt; break;
    case TK::Gt: cmp = BinaryOperator::Gt; break;
    case TK::Le: cmp = BinaryOperator::Le; break;
    case TK::Ge: cmp = BinaryOperator::Ge; break;
    case TK::EqEq: cmp = BinaryOperator::Eq; break;
    case TK::NotEq: cmp = BinaryOperator::Ne; break;
    case TK::In: cmp = BinaryOperator::In; break;
    case TK::Is:
      cmp = BinaryOperator::Is;
      if (next.kind == TK::Not) {
        cmp = BinaryOperator::IsNot;
        width = 2;
      }
      break;
    case TK::Not:
      // 'not' is infix only as part of 'not in'
      if (next.kind != TK::In) return false;
      cmp = BinaryOperator::NotIn;
      width = 2;
      break;
    default: return false;
  }
  op.cls = OpClass::Compare;
  op.prec = kPrecCompare;
  op.cmpOps.assign(1, cmp);
  return true;
}

// Pop the top pending operator and combine its operands.
void reduce(std::vector<PendingOp>& ops, std::vector<ast::ExprPtr>& operands) {
  PendingOp op = std::move(ops.back());
  ops.pop_back();
  const size_t base = operands.size() - op.arity;
  const ast::Span span{op.cls == OpClass::Prefix ? op.start : operands[base]->span};
  ast::Span full{span.line, span.col, operands.back()->span.endLine, operands.back()->span.endCol};
  ast::ExprPtr result;
  switch (op.cls) {
    case OpClass::Prefix:
      result = ast::makeExpr(ast::Unary{op.unOp, std::move(operands[base])}, full);
      break;
    case OpClass::Binary:
      result = ast::makeExpr(ast::Binary{std::move(operands[base]), op.binOp, std::move(operands[base + 1])}, full);
      break;
    case OpClass::Compare: {
      ast::Compare cmp;
      cmp.left = std::move(operands[base]);
      cmp.ops = std::move(op.cmpOps);
      for (size_t i = base + 1; i < operands.size(); ++i) cmp.comparators.push_back(std::move(operands[i]));
      result = ast::makeExpr(std::move(cmp), full);
      break;
    }
    case OpClass::Bool: {
      ast::BoolOp bop;
      bop.op = op.binOp;
      for (size_t i = base; i < operands.size(); ++i) bop.values.push_back(std::move(operands[i]));
      result = ast::makeExpr(std::move(bop), full);
      break;
    }
  }
  operands.resize(base);
  operands.push_back(std::move(result));
}

const char* closerText(const TK closer) {
  switch (closer) {
    case TK::RParen: return "',' or ')'";
    case TK::RBracket: return "',' or ']'";
    case TK::RBrace: return "',' or '}'";
    default: return "','";
  }
}

} // namespace

bool Parser::canStartExpression(const TK kind) {
  switch (kind) {
    case TK::Ident:
    case TK::Int:
    case TK::Float:
    case TK::Imag:
    case TK::String:
    case TK::Bytes:
    case TK::FString:
    case TK::None:
    case TK::True:
    case TK::False:
    case TK::Ellipsis:
    case TK::LParen:
    case TK::LBracket:
    case TK::LBrace:
    case TK::Minus:
    case TK::Plus:
    case TK::Tilde:
    case TK::Not:
    case TK::Lambda:
    case TK::Await:
      return true;
    default:
      return false;
  }
}

ast::ExprPtr Parser::parseStarExpressions() {
  const lex::Token& start = peek();
  auto element = [this]() -> ExprPtr {
    if (!at(TK::Star)) return parseTest();
    const lex::Token& star = get();
    ExprPtr value = parseBinary(kPrecBitOr);
    if (!value) return nullptr;
    return ast::makeExpr(ast::Starred{std::move(value)}, spanFrom(star));
  };
  ExprPtr first = element();
  if (!first || !at(TK::Comma)) return first;
  ast::TupleLiteral tuple;
  tuple.elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (!canStartExpression(peek().kind) && !at(TK::Star)) break; // trailing comma
    ExprPtr next = element();
    if (!next) return nullptr;
    tuple.elements.push_back(std::move(next));
  }
  return ast::makeExpr(std::move(tuple), spanFrom(start));
}

ast::ExprPtr Parser::parseStarOrNamed() {
  if (!at(TK::Star)) return parseNamedExpr();
  const lex::Token& star = get();
  ExprPtr value = parseBinary(kPrecBitOr);
  if (!value) return nullptr;
  return ast::makeExpr(ast::Starred{std::move(value)}, spanFrom(star));
}

ast::ExprPtr Parser::parseNamedExpr() {
  if (at(TK::Ident) && peek(1).kind == TK::ColonEqual) {
    const lex::Token& name = get();
    (void)get();
    ExprPtr value = parseTest();
    if (!value) return nullptr;
    ast::NamedExpr named;
    named.target = ast::makeExpr(ast::Name{name.text, ast::ExprContext::Store}, spanOf(name));
    named.value = std::move(value);
    return ast::makeExpr(std::move(named), spanFrom(name));
  }
  ExprPtr expr = parseTest();
  if (expr && at(TK::ColonEqual)) {
    errorAt(expr->span, ErrorKind::InvalidSyntax,
            std::string("cannot use assignment expressions with ") + describeExpr(*expr));
    return nullptr;
  }
  return expr;
}

ast::ExprPtr Parser::parseTest() {
  if (at(TK::Lambda)) return parseLambda();
  ExprPtr body = parseBinary(kPrecOr);
  if (!body || !at(TK::If)) return body;
  // a if b else c if d else e: arms collected iteratively, nested to the right
  struct Arm {
    ExprPtr body;
    ExprPtr test;
  };
  std::vector<Arm> arms;
  for (;;) {
    (void)get(); // 'if'
    ExprPtr test = parseBinary(kPrecOr);
    if (!test) return nullptr;
    if (!expect(TK::Else, "'else'")) return nullptr;
    arms.push_back(Arm{std::move(body), std::move(test)});
    if (at(TK::Lambda)) {
      body = parseLambda();
      if (!body) return nullptr;
      break;
    }
    body = parseBinary(kPrecOr);
    if (!body) return nullptr;
    if (!at(TK::If)) break;
  }
  ExprPtr result = std::move(body);
  for (auto it = arms.rbegin(); it != arms.rend(); ++it) {
    const ast::Span span = join(it->body->span, result->span);
    result = ast::makeExpr(ast::IfExpr{std::move(it->test), std::move(it->body), std::move(result)}, span);
  }
  return result;
}

ast::ExprPtr Parser::parseLambda() {
  DepthScope scope(depth_);
  if (!checkDepth("expression nested too deeply")) return nullptr;
  const lex::Token& start = get(); // 'lambda'
  ast::LambdaExpr lambda;
  if (!at(TK::Colon) && !parseParameters(lambda.args, TK::Colon, false)) return nullptr;
  if (!expect(TK::Colon, "':'")) return nullptr;
  lambda.body = parseTest();
  if (!lambda.body) return nullptr;
  return ast::makeExpr(std::move(lambda), spanFrom(start));
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::ExprPtr Parser::parseBinary(const int minPrec) {
  std::vector<ExprPtr> operands;
  std::vector<PendingOp> ops;
  for (;;) {
    // prefix operators
    for (;;) {
      const auto kind = peek().kind;
      const int leftPrec = ops.empty() ? minPrec : ops.back().prec;
      PendingOp prefix;
      prefix.cls = OpClass::Prefix;
      prefix.arity = 1;
      if (kind == TK::Not && leftPrec <= kPrecNot) {
        prefix.prec = kPrecNot;
        prefix.unOp = UnaryOperator::Not;
      } else if (kind == TK::Minus || kind == TK::Plus || kind == TK::Tilde) {
        prefix.prec = kPrecUnary;
        prefix.unOp = kind == TK::Minus ? UnaryOperator::Neg
                      : kind == TK::Plus ? UnaryOperator::Pos
                                         : UnaryOperator::BitNot;
      } else {
        break;
      }
      prefix.start = spanOf(get());
      ops.push_back(std::move(prefix));
    }
    ExprPtr operand = parseOperand();
    if (!operand) return nullptr;
    operands.push_back(std::move(operand));

    PendingOp op;
    size_t width = 1;
    if (!infixAt(peek(), peek(1), op, width) || op.prec < minPrec) break;
    for (size_t i = 0; i < width; ++i) (void)get();

    bool merged = false;
    while (!ops.empty()) {
      PendingOp& top = ops.back();
      if (top.prec == op.prec && top.cls == op.cls &&
          (op.cls == OpClass::Compare || (op.cls == OpClass::Bool && top.binOp == op.binOp))) {
        if (op.cls == OpClass::Compare) top.cmpOps.push_back(op.cmpOps.front());
        ++top.arity;
        merged = true;
        break;
      }
      const bool rightAssoc = op.prec == kPrecPower;
      if (rightAssoc ? top.prec <= op.prec : top.prec < op.prec) break;
      reduce(ops, operands);
    }
    if (!merged) ops.push_back(std::move(op));
  }
  while (!ops.empty()) reduce(ops, operands);
  return std::move(operands.back());
}

ast::ExprPtr Parser::parseOperand() {
  DepthScope scope(depth_);
  if (!checkDepth("too many nested parentheses")) return nullptr;
  // await binds tighter than any operator but looser than trailers
  std::vector<ast::Span> awaits;
  while (at(TK::Await)) awaits.push_back(spanOf(get()));
  ExprPtr expr = parsePrimary();
  if (!expr) return nullptr;
  for (auto it = awaits.rbegin(); it != awaits.rend(); ++it) {
    const ast::Span span = join(*it, expr->span);
    expr = ast::makeExpr(ast::AwaitExpr{std::move(expr)}, span);
  }
  return expr;
}

ast::ExprPtr Parser::parsePrimary() {
  ExprPtr expr = parseAtom();
  if (!expr) return nullptr;
  for (;;) {
    if (match(TK::Dot)) {
      if (!at(TK::Ident)) {
        errorExpected("attribute name");
        return nullptr;
      }
      const lex::Token& name = get();
      const ast::Span span = join(expr->span, spanOf(name));
      expr = ast::makeExpr(ast::Attribute{std::move(expr), name.text}, span);
    } else if (at(TK::LParen)) {
      (void)get();
      BracketScope bracket(openBrackets_, pos_ - 1);
      ast::Call call;
      if (!parseCallArguments(call.args, call.keywords)) return nullptr;
      const ast::Span span = join(expr->span, spanOf(previous()));
      call.func = std::move(expr);
      expr = ast::makeExpr(std::move(call), span);
    } else if (at(TK::LBracket)) {
      (void)get();
      BracketScope bracket(openBrackets_, pos_ - 1);
      ExprPtr index = parseSubscript();
      if (!index || !expect(TK::RBracket, "']'")) return nullptr;
      const ast::Span span = join(expr->span, spanOf(previous()));
      expr = ast::makeExpr(ast::Subscript{std::move(expr), std::move(index)}, span);
    } else {
      return expr;
    }
  }
}

ast::ExprPtr Parser::parseAtom() {
  const lex::Token& tok = peek();
  ast::Constant constant;
  switch (tok.kind) {
    case TK::Ident:
      (void)get();
      return ast::makeExpr(ast::Name{tok.text}, spanOf(tok));
    case TK::Int:
      constant.kind = ast::Constant::Kind::Int;
      if (const auto* value = std::get_if<support::BigInt>(&tok.value)) constant.intValue = *value;
      break;
    case TK::Float:
    case TK::Imag:
      constant.kind = tok.kind == TK::Float ? ast::Constant::Kind::Float : ast::Constant::Kind::Imag;
      if (const auto* value = std::get_if<double>(&tok.value)) constant.floatValue = *value;
      break;
    case TK::String:
    case TK::Bytes:
    case TK::FString:
      return parseStrings();
    case TK::None: constant.kind = ast::Constant::Kind::None; break;
    case TK::True: constant.kind = ast::Constant::Kind::True; break;
    case TK::False: constant.kind = ast::Constant::Kind::False; break;
    case TK::Ellipsis: constant.kind = ast::Constant::Kind::Ellipsis; break;
    case TK::LParen:
    case TK::LBracket:
    case TK::LBrace:
      return parseDisplay(get());
    default:
      errorExpected("expression");
      return nullptr;
  }
  (void)get();
  return ast::makeExpr(std::move(constant), spanOf(tok));
}

ast::ExprPtr Parser::parseDisplay(const lex::Token& open) {
  BracketScope bracket(openBrackets_, pos_ - 1);
  switch (open.kind) {
    case TK::LParen: return parseParenthesized(open);
    case TK::LBracket: return parseBracketDisplay(open);
    default: return parseBraceDisplay(open);
  }
}

bool Parser::parseDisplayElements(ast::ExprList& out, const TK closer) {
  // Called after a separating comma; a trailing comma before the closer is fine
  for (;;) {
    if (match(closer)) return true;
    ExprPtr element = parseStarOrNamed();
    if (!element) return false;
    out.push_back(std::move(element));
    if (match(closer)) return true;
    if (!expect(TK::Comma, closerText(closer))) return false;
  }
}

ast::ExprPtr Parser::parseParenthesized(const lex::Token& open) {
  if (match(TK::RParen)) return ast::makeExpr(ast::TupleLiteral{}, spanFrom(open));
  if (at(TK::Yield)) {
    ExprPtr yield = parseYieldExpr();
    if (!yield || !expect(TK::RParen, "')'")) return nullptr;
    return yield;
  }
  ExprPtr first = parseStarOrNamed();
  if (!first) return nullptr;
  if (at(TK::For) || (at(TK::Async) && peek(1).kind == TK::For)) {
    if (first->is<ast::Starred>()) {
      errorAt(first->span, ErrorKind::InvalidSyntax, "iterable unpacking cannot be used in comprehension");
      return nullptr;
    }
    ast::Comprehension comp;
    comp.kind = ast::ComprehensionKind::Generator;
    comp.elt = std::move(first);
    if (!parseComprehensionFors(comp.generators) || !expect(TK::RParen, "')'")) return nullptr;
    return ast::makeExpr(std::move(comp), spanFrom(open));
  }
  if (match(TK::RParen)) {
    if (first->is<ast::Starred>()) {
      errorAt(first->span, ErrorKind::InvalidSyntax, "cannot use starred expression here");
      return nullptr;
    }
    return first;
  }
  ast::TupleLiteral tuple;
  tuple.elements.push_back(std::move(first));
  if (!expect(TK::Comma, "',' or ')'") || !parseDisplayElements(tuple.elements, TK::RParen)) return nullptr;
  return ast::makeExpr(std::move(tuple), spanFrom(open));
}

ast::ExprPtr Parser::parseBracketDisplay(const lex::Token& open) {
  if (match(TK::RBracket)) return ast::makeExpr(ast::ListLiteral{}, spanFrom(open));
  ExprPtr first = parseStarOrNamed();
  if (!first) return nullptr;
  if (at(TK::For) || (at(TK::Async) && peek(1).kind == TK::For)) {
    if (first->is<ast::Starred>()) {
      errorAt(first->span, ErrorKind::InvalidSyntax, "iterable unpacking cannot be used in comprehension");
      return nullptr;
    }
    ast::Comprehension comp;
    comp.kind = ast::ComprehensionKind::List;
    comp.elt = std::move(first);
    if (!parseComprehensionFors(comp.generators) || !expect(TK::RBracket, "']'")) return nullptr;
    return ast::makeExpr(std::move(comp), spanFrom(open));
  }
  ast::ListLiteral list;
  list.elements.push_back(std::move(first));
  if (!match(TK::RBracket)) {
    if (!expect(TK::Comma, "',' or ']'") || !parseDisplayElements(list.elements, TK::RBracket)) return nullptr;
  }
  return ast::makeExpr(std::move(list), spanFrom(open));
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::ExprPtr Parser::parseBraceDisplay(const lex::Token& open) {
  if (match(TK::RBrace)) return ast::makeExpr(ast::DictLiteral{}, spanFrom(open));

  ExprPtr first;
  if (!at(TK::StarStar)) {
    first = parseStarOrNamed();
    if (!first) return nullptr;
  }
  if (first && !at(TK::Colon)) {
    // set display or set comprehension
    if (at(TK::For) || (at(TK::Async) && peek(1).kind == TK::For)) {
      if (first->is<ast::Starred>()) {
        errorAt(first->span, ErrorKind::InvalidSyntax, "iterable unpacking cannot be used in comprehension");
        return nullptr;
      }
      ast::Comprehension comp;
      comp.kind = ast::ComprehensionKind::Set;
      comp.elt = std::move(first);
      if (!parseComprehensionFors(comp.generators) || !expect(TK::RBrace, "'}'")) return nullptr;
      return ast::makeExpr(std::move(comp), spanFrom(open));
    }
    ast::SetLiteral set;
    set.elements.push_back(std::move(first));
    if (!match(TK::RBrace)) {
      if (!expect(TK::Comma, "',' or '}'") || !parseDisplayElements(set.elements, TK::RBrace)) return nullptr;
    }
    return ast::makeExpr(std::move(set), spanFrom(open));
  }

  if (first && first->is<ast::Starred>()) {
    errorAt(first->span, ErrorKind::InvalidSyntax, "cannot use a starred expression in a dictionary value");
    return nullptr;
  }
  ast::DictLiteral dict;
  auto entry = [&](ExprPtr key) -> bool {
    if (!key) {
      // **mapping
      if (!expect(TK::StarStar, "'**'")) return false;
      ExprPtr value = parseBinary(kPrecBitOr);
      if (!value) return false;
      dict.keys.push_back(nullptr);
      dict.values.push_back(std::move(value));
      return true;
    }
    if (!expect(TK::Colon, "':'")) return false;
    ExprPtr value = parseTest();
    if (!value) return false;
    dict.keys.push_back(std::move(key));
    dict.values.push_back(std::move(value));
    return true;
  };
  if (!entry(std::move(first))) return nullptr;

  if (at(TK::For) || (at(TK::Async) && peek(1).kind == TK::For)) {
    if (!dict.keys.front()) {
      errorAt(dict.values.front()->span, ErrorKind::InvalidSyntax,
              "dict unpacking cannot be used in dict comprehension");
      return nullptr;
    }
    ast::Comprehension comp;
    comp.kind = ast::ComprehensionKind::Dict;
    comp.elt = std::move(dict.keys.front());
    comp.value = std::move(dict.values.front());
    if (!parseComprehensionFors(comp.generators) || !expect(TK::RBrace, "'}'")) return nullptr;
    return ast::makeExpr(std::move(comp), spanFrom(open));
  }

  while (!match(TK::RBrace)) {
    if (!expect(TK::Comma, "',' or '}'")) return nullptr;
    if (match(TK::RBrace)) break;
    ExprPtr key;
    if (!at(TK::StarStar)) {
      key = parseTest();
      if (!key) return nullptr;
    }
    if (!entry(std::move(key))) return nullptr;
  }
  return ast::makeExpr(std::move(dict), spanFrom(open));
}

bool Parser::parseComprehensionFors(std::vector<ast::ComprehensionFor>& out) {
  while (at(TK::For) || (at(TK::Async) && peek(1).kind == TK::For)) {
    ast::ComprehensionFor clause;
    clause.isAsync = match(TK::Async);
    (void)get(); // 'for'
    clause.target = parseTargetList();
    if (!clause.target || !setTarget(*clause.target, ast::ExprContext::Store)) return false;
    if (!expect(TK::In, "'in'")) return false;
    clause.iter = parseBinary(kPrecOr);
    if (!clause.iter) return false;
    while (match(TK::If)) {
      ExprPtr cond = parseBinary(kPrecOr);
      if (!cond) return false;
      clause.ifs.push_back(std::move(cond));
    }
    out.push_back(std::move(clause));
  }
  return true;
}

ast::ExprPtr Parser::parseTargetList() {
  const lex::Token& start = peek();
  auto element = [this]() -> ExprPtr {
    if (!at(TK::Star)) return parseBinary(kPrecBitOr);
    const lex::Token& star = get();
    ExprPtr value = parseBinary(kPrecBitOr);
    if (!value) return nullptr;
    return ast::makeExpr(ast::Starred{std::move(value)}, spanFrom(star));
  };
  ExprPtr first = element();
  if (!first || !at(TK::Comma)) return first;
  ast::TupleLiteral tuple;
  tuple.elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (!canStartExpression(peek().kind) && !at(TK::Star)) break;
    ExprPtr next = element();
    if (!next) return nullptr;
    tuple.elements.push_back(std::move(next));
  }
  return ast::makeExpr(std::move(tuple), spanFrom(start));
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
bool Parser::parseCallArguments(ast::ExprList& args, std::vector<ast::Keyword>& keywords) {
  bool sawKeyword = false;
  bool sawKwUnpack = false;
  while (!at(TK::RParen)) {
    const lex::Token& start = peek();
    if (match(TK::Star)) {
      ExprPtr value = parseTest();
      if (!value) return false;
      if (sawKwUnpack) {
        errorAt(start, ErrorKind::InvalidSyntax, "iterable argument unpacking follows keyword argument unpacking");
        return false;
      }
      args.push_back(ast::makeExpr(ast::Starred{std::move(value)}, spanFrom(start)));
    } else if (match(TK::StarStar)) {
      ExprPtr value = parseTest();
      if (!value) return false;
      keywords.push_back(ast::Keyword{std::string(), std::move(value), spanFrom(start)});
      sawKwUnpack = true;
    } else if (at(TK::Ident) && peek(1).kind == TK::Equal) {
      const lex::Token& name = get();
      (void)get();
      ExprPtr value = parseTest();
      if (!value) return false;
      for (const auto& kw : keywords) {
        if (kw.name == name.text) {
          errorAt(name, ErrorKind::InvalidSyntax, "keyword argument repeated: " + name.text);
          return false;
        }
      }
      keywords.push_back(ast::Keyword{name.text, std::move(value), spanFrom(start)});
      sawKeyword = true;
    } else {
      ExprPtr value = parseNamedExpr();
      if (!value) return false;
      if (at(TK::Equal)) {
        errorAt(value->span, ErrorKind::InvalidSyntax,
                "expression cannot contain assignment, perhaps you meant \"==\"?");
        return false;
      }
      if (at(TK::For) || (at(TK::Async) && peek(1).kind == TK::For)) {
        ast::Comprehension comp;
        comp.kind = ast::ComprehensionKind::Generator;
        comp.elt = std::move(value);
        if (!parseComprehensionFors(comp.generators)) return false;
        const ast::Span span = spanFrom(start);
        if (!args.empty() || !keywords.empty() || !at(TK::RParen)) {
          errorAt(span, ErrorKind::InvalidSyntax, "generator expression must be parenthesized");
          return false;
        }
        args.push_back(ast::makeExpr(std::move(comp), span));
        continue;
      }
      if (sawKwUnpack || sawKeyword) {
        errorAt(value->span, ErrorKind::InvalidSyntax,
                sawKwUnpack ? "positional argument follows keyword argument unpacking"
                            : "positional argument follows keyword argument");
        return false;
      }
      args.push_back(std::move(value));
    }
    if (!match(TK::Comma)) break;
  }
  return expect(TK::RParen, "',' or ')'");
}

ast::ExprPtr Parser::parseSubscript() {
  const lex::Token& start = peek();
  ExprPtr first = parseSliceItem();
  if (!first || !at(TK::Comma)) return first;
  ast::TupleLiteral tuple;
  tuple.elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (at(TK::RBracket)) break;
    ExprPtr next = parseSliceItem();
    if (!next) return nullptr;
    tuple.elements.push_back(std::move(next));
  }
  return ast::makeExpr(std::move(tuple), spanFrom(start));
}

ast::ExprPtr Parser::parseSliceItem() {
  const lex::Token& start = peek();
  ast::Slice slice;
  if (!at(TK::Colon)) {
    ExprPtr lower = parseStarOrNamed();
    if (!lower || !at(TK::Colon)) return lower;
    slice.lower = std::move(lower);
  }
  (void)get(); // ':'
  auto boundary = [this]() { return at(TK::Colon) || at(TK::Comma) || at(TK::RBracket); };
  if (!boundary()) {
    slice.upper = parseTest();
    if (!slice.upper) return nullptr;
  }
  if (match(TK::Colon) && !at(TK::Comma) && !at(TK::RBracket)) {
    slice.step = parseTest();
    if (!slice.step) return nullptr;
  }
  return ast::makeExpr(std::move(slice), spanFrom(start));
}

ast::ExprPtr Parser::parseYieldExpr() {
  const lex::Token& start = get(); // 'yield'
  if (match(TK::From)) {
    ExprPtr value = parseTest();
    if (!value) return nullptr;
    return ast::makeExpr(ast::YieldFromExpr{std::move(value)}, spanFrom(start));
  }
  ast::YieldExpr yield;
  if (canStartExpression(peek().kind) || at(TK::Star)) {
    yield.value = parseStarExpressions();
    if (!yield.value) return nullptr;
  }
  return ast::makeExpr(std::move(yield), spanFrom(start));
}

} // namespace pyrite::parse
