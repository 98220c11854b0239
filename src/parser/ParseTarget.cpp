/***
 * Name: pyrite::parse::Parser (targets)
 * Purpose: Reinterpret an already parsed expression as an assignment or
 *   deletion target.
 * Theory of Operation: Names, attributes and subscripts receive the target
 *   context directly; tuples and lists recurse into their elements, allowing
 *   at most one starred element per level. Anything else is reported with a
 *   description of what was found ("cannot assign to function call").
 */
#include "parser/Parser.h"

#include <string>

namespace pyrite::parse {

const char* Parser::describeExpr(const ast::Expr& e) {
  if (const auto* c = e.getIf<ast::Constant>()) {
    switch (c->kind) {
      case ast::Constant::Kind::None: return "None";
      case ast::Constant::Kind::True: return "True";
      case ast::Constant::Kind::False: return "False";
      case ast::Constant::Kind::Ellipsis: return "ellipsis";
      default: return "literal";
    }
  }
  if (e.is<ast::Name>()) return "name";
  if (e.is<ast::Attribute>()) return "attribute";
  if (e.is<ast::Subscript>()) return "subscript";
  if (e.is<ast::Starred>()) return "starred";
  if (e.is<ast::TupleLiteral>()) return "tuple";
  if (e.is<ast::ListLiteral>()) return "list";
  if (e.is<ast::Call>()) return "function call";
  if (e.is<ast::Compare>()) return "comparison";
  if (e.is<ast::LambdaExpr>()) return "lambda";
  if (e.is<ast::IfExpr>()) return "conditional expression";
  if (e.is<ast::NamedExpr>()) return "named expression";
  if (e.is<ast::DictLiteral>()) return "dict literal";
  if (e.is<ast::SetLiteral>()) return "set display";
  if (e.is<ast::FStringLiteral>()) return "f-string expression";
  if (e.is<ast::AwaitExpr>()) return "await expression";
  if (e.is<ast::YieldExpr>() || e.is<ast::YieldFromExpr>()) return "yield expression";
  if (const auto* comp = e.getIf<ast::Comprehension>()) {
    switch (comp->kind) {
      case ast::ComprehensionKind::List: return "list comprehension";
      case ast::ComprehensionKind::Set: return "set comprehension";
      case ast::ComprehensionKind::Dict: return "dict comprehension";
      case ast::ComprehensionKind::Generator: return "generator expression";
    }
  }
  return "expression";
}

bool Parser::setTarget(ast::Expr& target, const ast::ExprContext ctx) {
  if (auto* name = target.getIf<ast::Name>()) {
    name->ctx = ctx;
    return true;
  }
  if (auto* attr = target.getIf<ast::Attribute>()) {
    attr->ctx = ctx;
    return true;
  }
  if (auto* sub = target.getIf<ast::Subscript>()) {
    sub->ctx = ctx;
    return true;
  }
  if (auto* tuple = target.getIf<ast::TupleLiteral>()) {
    tuple->ctx = ctx;
    return setTargetElements(tuple->elements, ctx);
  }
  if (auto* list = target.getIf<ast::ListLiteral>()) {
    list->ctx = ctx;
    return setTargetElements(list->elements, ctx);
  }
  if (target.is<ast::Starred>()) {
    errorAt(target.span, ErrorKind::InvalidSyntax,
            ctx == ast::ExprContext::Del ? "cannot delete starred"
                                         : "starred assignment target must be in a list or tuple");
    return false;
  }
  const std::string verb = ctx == ast::ExprContext::Del ? "cannot delete " : "cannot assign to ";
  errorAt(target.span, ErrorKind::InvalidSyntax, verb + describeExpr(target));
  return false;
}

bool Parser::setTargetElements(ast::ExprList& elements, const ast::ExprContext ctx) {
  size_t starred = 0;
  for (auto& element : elements) {
    auto* star = element->getIf<ast::Starred>();
    if (!star) {
      if (!setTarget(*element, ctx)) return false;
      continue;
    }
    if (ctx == ast::ExprContext::Del) {
      errorAt(element->span, ErrorKind::InvalidSyntax, "cannot delete starred");
      return false;
    }
    if (++starred > 1) {
      errorAt(element->span, ErrorKind::InvalidSyntax, "multiple starred expressions in assignment");
      return false;
    }
    star->ctx = ctx;
    if (!setTarget(*star->value, ctx)) return false;
  }
  return true;
}

} // namespace pyrite::parse
