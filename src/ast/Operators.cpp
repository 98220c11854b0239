/***
 * Name: pyrite::ast to_string / kindName
 * Purpose: Stable spellings for AST enums and node alternatives, used by the
 *   printer, diagnostics and tests.
 */
#include <variant>
#include "ast/Nodes.h"
#include "pyrite/support/overloaded.h"

namespace pyrite::ast {

const char* to_string(const BinaryOperator op) {
  using enum BinaryOperator;
  switch (op) {
    case Add: return "+";
    case Sub: return "-";
    case Mul: return "*";
    case MatMul: return "@";
    case Div: return "/";
    case Mod: return "%";
    case FloorDiv: return "//";
    case Pow: return "**";
    case LShift: return "<<";
    case RShift: return ">>";
    case BitAnd: return "&";
    case BitOr: return "|";
    case BitXor: return "^";
    case Eq: return "==";
    case Ne: return "!=";
    case Lt: return "<";
    case Le: return "<=";
    case Gt: return ">";
    case Ge: return ">=";
    case Is: return "is";
    case IsNot: return "is not";
    case In: return "in";
    case NotIn: return "not in";
    case And: return "and";
    case Or: return "or";
  }
  return "?";
}

const char* to_string(const UnaryOperator op) {
  using enum UnaryOperator;
  switch (op) {
    case Neg: return "-";
    case Pos: return "+";
    case Not: return "not";
    case BitNot: return "~";
  }
  return "?";
}

const char* to_string(const ExprContext ctx) {
  switch (ctx) {
    case ExprContext::Load: return "Load";
    case ExprContext::Store: return "Store";
    case ExprContext::Del: return "Del";
  }
  return "?";
}

const char* to_string(const Constant::Kind kind) {
  using enum Constant::Kind;
  switch (kind) {
    case None: return "None";
    case True: return "True";
    case False: return "False";
    case Ellipsis: return "Ellipsis";
    case Int: return "Int";
    case Float: return "Float";
    case Imag: return "Imag";
    case Str: return "Str";
    case Bytes: return "Bytes";
  }
  return "?";
}

const char* to_string(const ComprehensionKind kind) {
  switch (kind) {
    case ComprehensionKind::List: return "ListComp";
    case ComprehensionKind::Set: return "SetComp";
    case ComprehensionKind::Dict: return "DictComp";
    case ComprehensionKind::Generator: return "GeneratorExp";
  }
  return "?";
}

const char* kindName(const Expr& e) {
  using support::overloaded;
  return std::visit(overloaded{
                        [](const Name&) { return "Name"; },
                        [](const Constant&) { return "Constant"; },
                        [](const Binary&) { return "Binary"; },
                        [](const BoolOp&) { return "BoolOp"; },
                        [](const Unary&) { return "Unary"; },
                        [](const Compare&) { return "Compare"; },
                        [](const Call&) { return "Call"; },
                        [](const Attribute&) { return "Attribute"; },
                        [](const Subscript&) { return "Subscript"; },
                        [](const Slice&) { return "Slice"; },
                        [](const ListLiteral&) { return "List"; },
                        [](const TupleLiteral&) { return "Tuple"; },
                        [](const SetLiteral&) { return "Set"; },
                        [](const DictLiteral&) { return "Dict"; },
                        [](const Comprehension& c) { return to_string(c.kind); },
                        [](const LambdaExpr&) { return "Lambda"; },
                        [](const IfExpr&) { return "IfExpr"; },
                        [](const FStringLiteral&) { return "FString"; },
                        [](const Starred&) { return "Starred"; },
                        [](const NamedExpr&) { return "NamedExpr"; },
                        [](const AwaitExpr&) { return "Await"; },
                        [](const YieldExpr&) { return "Yield"; },
                        [](const YieldFromExpr&) { return "YieldFrom"; },
                    },
                    e.node);
}

const char* kindName(const Stmt& s) {
  using support::overloaded;
  return std::visit(overloaded{
                        [](const FunctionDef&) { return "FunctionDef"; },
                        [](const ClassDef&) { return "ClassDef"; },
                        [](const ReturnStmt&) { return "Return"; },
                        [](const DelStmt&) { return "Delete"; },
                        [](const AssignStmt&) { return "Assign"; },
                        [](const AugAssignStmt&) { return "AugAssign"; },
                        [](const AnnAssignStmt&) { return "AnnAssign"; },
                        [](const ForStmt&) { return "For"; },
                        [](const WhileStmt&) { return "While"; },
                        [](const IfStmt&) { return "If"; },
                        [](const WithStmt&) { return "With"; },
                        [](const RaiseStmt&) { return "Raise"; },
                        [](const TryStmt&) { return "Try"; },
                        [](const AssertStmt&) { return "Assert"; },
                        [](const Import&) { return "Import"; },
                        [](const ImportFrom&) { return "ImportFrom"; },
                        [](const GlobalStmt&) { return "Global"; },
                        [](const NonlocalStmt&) { return "Nonlocal"; },
                        [](const ExprStmt&) { return "Expr"; },
                        [](const PassStmt&) { return "Pass"; },
                        [](const BreakStmt&) { return "Break"; },
                        [](const ContinueStmt&) { return "Continue"; },
                        [](const MatchStmt&) { return "Match"; },
                    },
                    s.node);
}

const char* kindName(const Pattern& p) {
  using support::overloaded;
  return std::visit(overloaded{
                        [](const PatternWildcard&) { return "MatchWildcard"; },
                        [](const PatternName&) { return "MatchCapture"; },
                        [](const PatternValue&) { return "MatchValue"; },
                        [](const PatternSequence&) { return "MatchSequence"; },
                        [](const PatternStar&) { return "MatchStar"; },
                        [](const PatternMapping&) { return "MatchMapping"; },
                        [](const PatternClass&) { return "MatchClass"; },
                        [](const PatternOr&) { return "MatchOr"; },
                        [](const PatternAs&) { return "MatchAs"; },
                    },
                    p.node);
}

} // namespace pyrite::ast
