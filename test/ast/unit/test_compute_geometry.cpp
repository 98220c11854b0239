/***
 * Name: test_compute_geometry
 * Purpose: Node counts, tree depth and block nesting of parsed modules.
 */
#include <gtest/gtest.h>
#include <string>
#include "ast/GeometrySummary.h"
#include "parser/Parser.h"

using namespace pyrite;

static ast::GeometrySummary geometryOf(const std::string& src) {
  auto r = parse::parseSource(src, "g.py");
  EXPECT_TRUE(r.ok());
  if (!r.module) return {};
  return ast::ComputeGeometry(*r.module);
}

TEST(ComputeGeometry, EmptyModule) {
  const auto g = geometryOf("");
  EXPECT_EQ(1u, g.nodes);
  EXPECT_EQ(1u, g.maxDepth);
  EXPECT_EQ(0u, g.statements);
  EXPECT_EQ(0u, g.maxBlockDepth);
}

TEST(ComputeGeometry, FlatStatements) {
  // Module, Assign, Name, Constant, Expr, Call, Name
  const auto g = geometryOf("x = 1\nf()\n");
  EXPECT_EQ(7u, g.nodes);
  EXPECT_EQ(4u, g.maxDepth);
  EXPECT_EQ(2u, g.statements);
  EXPECT_EQ(1u, g.maxBlockDepth);
}

TEST(ComputeGeometry, NestedBlock) {
  const auto g = geometryOf("if a:\n    x = 1\n");
  EXPECT_EQ(6u, g.nodes);
  EXPECT_EQ(4u, g.maxDepth);
  EXPECT_EQ(2u, g.statements);
  EXPECT_EQ(2u, g.maxBlockDepth);
}

TEST(ComputeGeometry, BlocksInsideDefinitions) {
  const char* src =
      "class C:\n"
      "    def m(self):\n"
      "        for i in r:\n"
      "            while i:\n"
      "                pass\n";
  const auto g = geometryOf(src);
  EXPECT_EQ(5u, g.statements);
  EXPECT_EQ(5u, g.maxBlockDepth);
}

TEST(ComputeGeometry, ExpressionDepth) {
  // Module > Expr > Binary(+) > Binary(*) > Name
  const auto g = geometryOf("a + b * c\n");
  EXPECT_EQ(5u, g.maxDepth);
  EXPECT_EQ(1u, g.maxBlockDepth);
}

TEST(ComputeGeometry, DeepTreesDoNotRecurse) {
  std::string src = "x = ";
  for (int i = 0; i < 400; ++i) src += "(";
  src += "1";
  for (int i = 0; i < 400; ++i) src += ")";
  src += "\n";
  const auto g = geometryOf(src);
  EXPECT_EQ(4u, g.nodes); // parentheses add no nodes
  EXPECT_EQ(3u, g.maxDepth);
}
