/***
 * Name: test_parser_assignment
 * Purpose: Assignment, augmented and annotated assignment, deletion and the
 *   validation of assignment targets.
 */
#include <gtest/gtest.h>
#include <string>
#include "ast/Nodes.h"
#include "parser/Parser.h"

using namespace pyrite;
using ast::ExprContext;

static parse::ParseResult parseText(const std::string& src) { return parse::parseSource(src, "t.py"); }

static std::string firstMessage(const parse::ParseResult& r) {
  return r.errors.empty() ? std::string() : r.errors.front().message;
}

TEST(ParserAssign, ChainedTargets) {
  auto r = parseText("a = b.c = d[0] = 1\n");
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& assign = r.module->body[0]->as<ast::AssignStmt>();
  ASSERT_EQ(3u, assign.targets.size());
  EXPECT_EQ(ExprContext::Store, assign.targets[0]->as<ast::Name>().ctx);
  EXPECT_EQ(ExprContext::Store, assign.targets[1]->as<ast::Attribute>().ctx);
  EXPECT_EQ(ExprContext::Store, assign.targets[2]->as<ast::Subscript>().ctx);
  EXPECT_TRUE(assign.value->is<ast::Constant>());
}

TEST(ParserAssign, StarredUnpacking) {
  auto r = parseText("a, *b, c = seq\n[x, (y, z)] = pair\n");
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& tuple = r.module->body[0]->as<ast::AssignStmt>().targets[0]->as<ast::TupleLiteral>();
  EXPECT_EQ(ExprContext::Store, tuple.ctx);
  ASSERT_EQ(3u, tuple.elements.size());
  const auto& star = tuple.elements[1]->as<ast::Starred>();
  EXPECT_EQ(ExprContext::Store, star.ctx);
  EXPECT_EQ(ExprContext::Store, star.value->as<ast::Name>().ctx);

  const auto& list = r.module->body[1]->as<ast::AssignStmt>().targets[0]->as<ast::ListLiteral>();
  EXPECT_EQ(ExprContext::Store, list.elements[1]->as<ast::TupleLiteral>().ctx);
}

TEST(ParserAssign, InvalidTargets) {
  struct Case {
    const char* src;
    const char* message;
  };
  const Case cases[] = {
      {"*a, *b = seq\n", "multiple starred expressions in assignment"},
      {"f() = 1\n", "cannot assign to function call"},
      {"a + 1 = 2\n", "cannot assign to expression"},
      {"None = 1\n", "cannot assign to None"},
      {"1 = x\n", "cannot assign to literal"},
      {"(a, f()) = t\n", "cannot assign to function call"},
      {"*a = b\n", "starred assignment target must be in a list or tuple"},
      {"x = *a\n", "can't use starred expression here"},
      {"*a\n", "can't use starred expression here"},
  };
  for (const auto& c : cases) {
    auto r = parseText(c.src);
    ASSERT_FALSE(r.ok()) << c.src;
    EXPECT_EQ(c.message, firstMessage(r)) << c.src;
    EXPECT_EQ(parse::ErrorKind::InvalidSyntax, r.errors[0].kind) << c.src;
  }
}

TEST(ParserAssign, AugmentedAssignment) {
  auto r = parseText("x += 1\nself.n //= 2\nd[k] **= 3\n");
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& aug = r.module->body[0]->as<ast::AugAssignStmt>();
  EXPECT_EQ(ast::BinaryOperator::Add, aug.op);
  EXPECT_EQ(ExprContext::Store, aug.target->as<ast::Name>().ctx);
  EXPECT_EQ(ast::BinaryOperator::FloorDiv, r.module->body[1]->as<ast::AugAssignStmt>().op);
  EXPECT_EQ(ast::BinaryOperator::Pow, r.module->body[2]->as<ast::AugAssignStmt>().op);
}

TEST(ParserAssign, AugmentedAssignmentRejections) {
  auto tuple = parseText("a, b += 1\n");
  ASSERT_FALSE(tuple.ok());
  EXPECT_EQ("'tuple' is an illegal expression for augmented assignment", firstMessage(tuple));

  auto chained = parseText("a += b = 1\n");
  ASSERT_FALSE(chained.ok());
  EXPECT_EQ("augmented assignment cannot be chained", firstMessage(chained));

  auto mixed = parseText("a = b += 1\n");
  ASSERT_FALSE(mixed.ok());
  EXPECT_EQ("augmented assignment cannot be chained with '='", firstMessage(mixed));
}

TEST(ParserAssign, AnnotatedAssignment) {
  auto r = parseText("x: int = 5\n(y): str\nself.z: list[int] = []\n");
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& first = r.module->body[0]->as<ast::AnnAssignStmt>();
  EXPECT_TRUE(first.simple);
  EXPECT_NE(nullptr, first.value);
  const auto& second = r.module->body[1]->as<ast::AnnAssignStmt>();
  EXPECT_FALSE(second.simple);
  EXPECT_EQ(nullptr, second.value);
  const auto& third = r.module->body[2]->as<ast::AnnAssignStmt>();
  EXPECT_FALSE(third.simple);
  EXPECT_TRUE(third.annotation->is<ast::Subscript>());
}

TEST(ParserAssign, AnnotationTargetErrors) {
  auto tuple = parseText("a, b: int\n");
  ASSERT_FALSE(tuple.ok());
  EXPECT_EQ("only single target (not tuple) can be annotated", firstMessage(tuple));
  auto list = parseText("[a]: int\n");
  ASSERT_FALSE(list.ok());
  EXPECT_EQ("only single target (not list) can be annotated", firstMessage(list));
  auto call = parseText("f(): int\n");
  ASSERT_FALSE(call.ok());
  EXPECT_EQ("illegal target for annotation", firstMessage(call));
}

TEST(ParserAssign, DeleteTargets) {
  auto r = parseText("del a, b[0], c.d,\n");
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& del = r.module->body[0]->as<ast::DelStmt>();
  ASSERT_EQ(3u, del.targets.size());
  EXPECT_EQ(ExprContext::Del, del.targets[0]->as<ast::Name>().ctx);
  EXPECT_EQ(ExprContext::Del, del.targets[1]->as<ast::Subscript>().ctx);
  EXPECT_EQ(ExprContext::Del, del.targets[2]->as<ast::Attribute>().ctx);

  auto bad = parseText("del f()\n");
  ASSERT_FALSE(bad.ok());
  EXPECT_EQ("cannot delete function call", firstMessage(bad));
}
