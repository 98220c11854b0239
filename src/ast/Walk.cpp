/***
 * Name: pyrite::ast::ForEachChild
 * Purpose: Enumerate the direct children of any AST node.
 * Inputs:
 *   - node: module, statement, expression or pattern
 *   - fn: callback receiving each child
 * Outputs: None (callback side effects)
 * Theory of Operation: One std::visit per node category; every alternative
 *   lists its owned children in source order, skipping null optional slots.
 */
#include "ast/Walk.h"

#include "pyrite/support/overloaded.h"

namespace pyrite::ast {

using support::overloaded;

namespace {

class Emitter {
 public:
  explicit Emitter(const ChildFn& fn) : fn_(fn) {}

  void operator()(const ExprPtr& e) const {
    if (e) fn_(NodeRef{e.get()});
  }
  void operator()(const StmtPtr& s) const {
    if (s) fn_(NodeRef{s.get()});
  }
  void operator()(const PatternPtr& p) const {
    if (p) fn_(NodeRef{p.get()});
  }
  void all(const ExprList& list) const {
    for (const auto& e : list) (*this)(e);
  }
  void all(const StmtList& list) const {
    for (const auto& s : list) (*this)(s);
  }
  void all(const std::vector<PatternPtr>& list) const {
    for (const auto& p : list) (*this)(p);
  }
  void param(const Param& p) const {
    (*this)(p.annotation);
    (*this)(p.defaultValue);
  }
  void arguments(const Arguments& a) const {
    for (const auto& p : a.posOnly) param(p);
    for (const auto& p : a.args) param(p);
    if (a.varArg) param(*a.varArg);
    for (const auto& p : a.kwOnly) param(p);
    if (a.kwArg) param(*a.kwArg);
  }
  void keywords(const std::vector<Keyword>& kws) const {
    for (const auto& k : kws) (*this)(k.value);
  }

 private:
  const ChildFn& fn_;
};

void exprChildren(const Expr& expr, const Emitter& emit) {
  std::visit(overloaded{
                 [](const Name&) {},
                 [](const Constant&) {},
                 [&](const Binary& n) {
                   emit(n.left);
                   emit(n.right);
                 },
                 [&](const BoolOp& n) { emit.all(n.values); },
                 [&](const Unary& n) { emit(n.operand); },
                 [&](const Compare& n) {
                   emit(n.left);
                   emit.all(n.comparators);
                 },
                 [&](const Call& n) {
                   emit(n.func);
                   emit.all(n.args);
                   emit.keywords(n.keywords);
                 },
                 [&](const Attribute& n) { emit(n.value); },
                 [&](const Subscript& n) {
                   emit(n.value);
                   emit(n.slice);
                 },
                 [&](const Slice& n) {
                   emit(n.lower);
                   emit(n.upper);
                   emit(n.step);
                 },
                 [&](const ListLiteral& n) { emit.all(n.elements); },
                 [&](const TupleLiteral& n) { emit.all(n.elements); },
                 [&](const SetLiteral& n) { emit.all(n.elements); },
                 [&](const DictLiteral& n) {
                   for (size_t i = 0; i < n.values.size(); ++i) {
                     if (i < n.keys.size()) emit(n.keys[i]);
                     emit(n.values[i]);
                   }
                 },
                 [&](const Comprehension& n) {
                   emit(n.elt);
                   emit(n.value);
                   for (const auto& gen : n.generators) {
                     emit(gen.target);
                     emit(gen.iter);
                     emit.all(gen.ifs);
                   }
                 },
                 [&](const LambdaExpr& n) {
                   emit.arguments(n.args);
                   emit(n.body);
                 },
                 [&](const IfExpr& n) {
                   emit(n.body);
                   emit(n.test);
                   emit(n.orelse);
                 },
                 [&](const FStringLiteral& n) {
                   for (const auto& seg : n.segments) {
                     if (const auto* fv = std::get_if<FormattedValue>(&seg)) {
                       emit(fv->value);
                       emit(fv->formatSpec);
                     }
                   }
                 },
                 [&](const Starred& n) { emit(n.value); },
                 [&](const NamedExpr& n) {
                   emit(n.target);
                   emit(n.value);
                 },
                 [&](const AwaitExpr& n) { emit(n.value); },
                 [&](const YieldExpr& n) { emit(n.value); },
                 [&](const YieldFromExpr& n) { emit(n.value); },
             },
             expr.node);
}

void stmtChildren(const Stmt& stmt, const Emitter& emit) {
  std::visit(overloaded{
                 [&](const FunctionDef& n) {
                   emit.all(n.decorators);
                   emit.arguments(n.args);
                   emit(n.returns);
                   emit.all(n.body);
                 },
                 [&](const ClassDef& n) {
                   emit.all(n.decorators);
                   emit.all(n.bases);
                   emit.keywords(n.keywords);
                   emit.all(n.body);
                 },
                 [&](const ReturnStmt& n) { emit(n.value); },
                 [&](const DelStmt& n) { emit.all(n.targets); },
                 [&](const AssignStmt& n) {
                   emit.all(n.targets);
                   emit(n.value);
                 },
                 [&](const AugAssignStmt& n) {
                   emit(n.target);
                   emit(n.value);
                 },
                 [&](const AnnAssignStmt& n) {
                   emit(n.target);
                   emit(n.annotation);
                   emit(n.value);
                 },
                 [&](const ForStmt& n) {
                   emit(n.target);
                   emit(n.iter);
                   emit.all(n.body);
                   emit.all(n.orelse);
                 },
                 [&](const WhileStmt& n) {
                   emit(n.test);
                   emit.all(n.body);
                   emit.all(n.orelse);
                 },
                 [&](const IfStmt& n) {
                   emit(n.test);
                   emit.all(n.body);
                   emit.all(n.orelse);
                 },
                 [&](const WithStmt& n) {
                   for (const auto& item : n.items) {
                     emit(item.contextExpr);
                     emit(item.optionalVars);
                   }
                   emit.all(n.body);
                 },
                 [&](const RaiseStmt& n) {
                   emit(n.exc);
                   emit(n.cause);
                 },
                 [&](const TryStmt& n) {
                   emit.all(n.body);
                   for (const auto& h : n.handlers) {
                     emit(h.type);
                     emit.all(h.body);
                   }
                   emit.all(n.orelse);
                   emit.all(n.finalbody);
                 },
                 [&](const AssertStmt& n) {
                   emit(n.test);
                   emit(n.msg);
                 },
                 [](const Import&) {},
                 [](const ImportFrom&) {},
                 [](const GlobalStmt&) {},
                 [](const NonlocalStmt&) {},
                 [&](const ExprStmt& n) { emit(n.value); },
                 [](const PassStmt&) {},
                 [](const BreakStmt&) {},
                 [](const ContinueStmt&) {},
                 [&](const MatchStmt& n) {
                   emit(n.subject);
                   for (const auto& c : n.cases) {
                     emit(c.pattern);
                     emit(c.guard);
                     emit.all(c.body);
                   }
                 },
             },
             stmt.node);
}

void patternChildren(const Pattern& pattern, const Emitter& emit) {
  std::visit(overloaded{
                 [](const PatternWildcard&) {},
                 [](const PatternName&) {},
                 [&](const PatternValue& n) { emit(n.value); },
                 [&](const PatternSequence& n) { emit.all(n.elements); },
                 [](const PatternStar&) {},
                 [&](const PatternMapping& n) {
                   for (size_t i = 0; i < n.keys.size(); ++i) {
                     emit(n.keys[i]);
                     if (i < n.patterns.size()) emit(n.patterns[i]);
                   }
                 },
                 [&](const PatternClass& n) {
                   emit(n.cls);
                   emit.all(n.args);
                   emit.all(n.kwdPatterns);
                 },
                 [&](const PatternOr& n) { emit.all(n.patterns); },
                 [&](const PatternAs& n) { emit(n.pattern); },
             },
             pattern.node);
}

} // namespace

void ForEachChild(NodeRef node, const ChildFn& fn) {
  const Emitter emit(fn);
  std::visit(overloaded{
                 [&](const Module* m) { emit.all(m->body); },
                 [&](const Stmt* s) { stmtChildren(*s, emit); },
                 [&](const Expr* e) { exprChildren(*e, emit); },
                 [&](const Pattern* p) { patternChildren(*p, emit); },
             },
             node);
}

} // namespace pyrite::ast
