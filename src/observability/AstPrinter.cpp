/***
 * Name: pyrite::obs::AstPrinter (impl)
 * Purpose: Node labels and the indented tree dump.
 */
#include "observability/AstPrinter.h"

#include <sstream>
#include <string>
#include <variant>
#include <vector>
#include "pyrite/support/overloaded.h"

namespace pyrite::obs {

using support::overloaded;

namespace {

std::string joinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& n : names) {
    if (!out.empty()) out += ",";
    out += n;
  }
  return out;
}

std::string aliases(const std::vector<ast::Alias>& names) {
  std::string out;
  for (const auto& a : names) {
    if (!out.empty()) out += ",";
    out += a.name;
    if (!a.asName.empty()) out += " as " + a.asName;
  }
  return out;
}

std::string params(const ast::Arguments& args) {
  std::vector<std::string> names;
  for (const auto& p : args.posOnly) names.push_back(p.name);
  if (!args.posOnly.empty()) names.emplace_back("/");
  for (const auto& p : args.args) names.push_back(p.name);
  if (args.varArg) {
    names.push_back("*" + args.varArg->name);
  } else if (!args.kwOnly.empty()) {
    names.emplace_back("*");
  }
  for (const auto& p : args.kwOnly) names.push_back(p.name);
  if (args.kwArg) names.push_back("**" + args.kwArg->name);
  return joinNames(names);
}

std::string constantLabel(const ast::Constant& c) {
  std::ostringstream oss;
  oss << "Constant " << ast::to_string(c.kind);
  switch (c.kind) {
    case ast::Constant::Kind::Int: oss << " " << c.intValue.toString(); break;
    case ast::Constant::Kind::Float:
    case ast::Constant::Kind::Imag: oss << " " << c.floatValue; break;
    case ast::Constant::Kind::Str:
    case ast::Constant::Kind::Bytes: oss << " \"" << c.text << "\""; break;
    default: break;
  }
  return oss.str();
}

std::string exprLabel(const ast::Expr& e) {
  const std::string kind = ast::kindName(e);
  return std::visit(
      overloaded{
          [&](const ast::Name& n) { return kind + " id=" + n.id + " ctx=" + ast::to_string(n.ctx); },
          [](const ast::Constant& c) { return constantLabel(c); },
          [&](const ast::Binary& n) { return kind + " op=" + ast::to_string(n.op); },
          [&](const ast::BoolOp& n) { return kind + " op=" + ast::to_string(n.op); },
          [&](const ast::Unary& n) { return kind + " op=" + ast::to_string(n.op); },
          [&](const ast::Compare& n) {
            std::string ops;
            for (const auto op : n.ops) {
              if (!ops.empty()) ops += ",";
              ops += ast::to_string(op);
            }
            return kind + " ops=" + ops;
          },
          [&](const ast::Call& n) {
            if (n.keywords.empty()) return kind;
            std::vector<std::string> names;
            for (const auto& k : n.keywords) names.push_back(k.name.empty() ? "**" : k.name);
            return kind + " keywords=" + joinNames(names);
          },
          [&](const ast::Attribute& n) { return kind + " attr=" + n.attr + " ctx=" + ast::to_string(n.ctx); },
          [&](const ast::Subscript& n) { return kind + " ctx=" + ast::to_string(n.ctx); },
          [&](const ast::ListLiteral& n) { return kind + " ctx=" + ast::to_string(n.ctx); },
          [&](const ast::TupleLiteral& n) { return kind + " ctx=" + ast::to_string(n.ctx); },
          [&](const ast::Starred& n) { return kind + " ctx=" + ast::to_string(n.ctx); },
          [&](const ast::LambdaExpr& n) { return kind + " params=" + params(n.args); },
          [&](const ast::FStringLiteral& n) {
            std::string text;
            for (const auto& segment : n.segments) {
              if (const auto* s = std::get_if<std::string>(&segment)) {
                text += *s;
              } else {
                const auto& f = std::get<ast::FormattedValue>(segment);
                text += "{";
                if (f.conversion != 0) text += std::string("!") + f.conversion;
                if (f.formatSpec) text += ":";
                text += "}";
              }
            }
            return kind + " \"" + text + "\"";
          },
          [&](const auto&) { return kind; },
      },
      e.node);
}

std::string stmtLabel(const ast::Stmt& s) {
  const std::string kind = ast::kindName(s);
  return std::visit(
      overloaded{
          [&](const ast::FunctionDef& n) {
            return std::string(n.isAsync ? "Async" : "") + kind + " name=" + n.name + " params=" + params(n.args);
          },
          [&](const ast::ClassDef& n) { return kind + " name=" + n.name; },
          [&](const ast::AugAssignStmt& n) { return kind + " op=" + ast::to_string(n.op); },
          [&](const ast::AnnAssignStmt& n) { return kind + (n.simple ? " simple" : ""); },
          [&](const ast::ForStmt& n) { return std::string(n.isAsync ? "Async" : "") + kind; },
          [&](const ast::WithStmt& n) { return std::string(n.isAsync ? "Async" : "") + kind; },
          [&](const ast::TryStmt& n) { return kind + " handlers=" + std::to_string(n.handlers.size()); },
          [&](const ast::Import& n) { return kind + " names=" + aliases(n.names); },
          [&](const ast::ImportFrom& n) {
            return kind + " module=" + n.module + " level=" + std::to_string(n.level) + " names=" + aliases(n.names);
          },
          [&](const ast::GlobalStmt& n) { return kind + " names=" + joinNames(n.names); },
          [&](const ast::NonlocalStmt& n) { return kind + " names=" + joinNames(n.names); },
          [&](const ast::MatchStmt& n) { return kind + " cases=" + std::to_string(n.cases.size()); },
          [&](const auto&) { return kind; },
      },
      s.node);
}

std::string patternLabel(const ast::Pattern& p) {
  const std::string kind = ast::kindName(p);
  return std::visit(overloaded{
                        [&](const ast::PatternName& n) { return kind + " name=" + n.name; },
                        [&](const ast::PatternStar& n) { return kind + " name=" + n.name.value_or("_"); },
                        [&](const ast::PatternSequence& n) { return kind + (n.isList ? " list" : " tuple"); },
                        [&](const ast::PatternMapping& n) {
                          return n.rest ? kind + " rest=" + *n.rest : kind;
                        },
                        [&](const ast::PatternClass& n) {
                          return n.kwdNames.empty() ? kind : kind + " kwd=" + joinNames(n.kwdNames);
                        },
                        [&](const ast::PatternAs& n) { return kind + " name=" + n.name; },
                        [&](const auto&) { return kind; },
                    },
                    p.node);
}

} // namespace

std::string AstPrinter::label(const ast::NodeRef node) {
  return std::visit(overloaded{
                        [](const ast::Module*) { return std::string("Module"); },
                        [](const ast::Stmt* s) { return stmtLabel(*s); },
                        [](const ast::Expr* e) { return exprLabel(*e); },
                        [](const ast::Pattern* p) { return patternLabel(*p); },
                    },
                    node);
}

std::string AstPrinter::print(const ast::Module& m) {
  ss_.str("");
  ss_.clear();
  depth_ = 0;
  emit(ast::NodeRef{&m});
  return ss_.str();
}

std::string AstPrinter::print(const ast::Expr& e) {
  ss_.str("");
  ss_.clear();
  depth_ = 0;
  emit(ast::NodeRef{&e});
  return ss_.str();
}

void AstPrinter::emit(const ast::NodeRef node) {
  for (int i = 0; i < depth_; ++i) ss_ << "  ";
  ss_ << label(node) << "\n";
  depth_++;
  ast::ForEachChild(node, [this](ast::NodeRef child) { emit(child); });
  depth_--;
}

} // namespace pyrite::obs
