/***
 * Name: test_parser_nesting
 * Purpose: Deeply nested input is accepted up to the configured bound and
 *   rejected with a diagnostic beyond it.
 */
#include <gtest/gtest.h>
#include <string>
#include "ast/Nodes.h"
#include "parser/Parser.h"

using namespace pyrite;

static std::string nested(const char open, const char close, const int depth, const std::string& core) {
  return std::string(static_cast<size_t>(depth), open) + core + std::string(static_cast<size_t>(depth), close);
}

static parse::ParseResult parseWithDepth(const std::string& src, const int maxDepth) {
  parse::ParserOptions options;
  options.maxNestingDepth = maxDepth;
  return parse::parseSource(src, "deep.py", {}, options);
}

TEST(ParserNesting, DeepParenthesesWithinDefaultBound) {
  auto r = parse::parseSource("x = " + nested('(', ')', 500, "1") + "\n", "deep.py");
  ASSERT_TRUE(r.ok()) << r.errors.front().message;
  const auto& value = *r.module->body[0]->as<ast::AssignStmt>().value;
  EXPECT_EQ(ast::Constant::Kind::Int, value.as<ast::Constant>().kind);
}

TEST(ParserNesting, DeepListsWithinDefaultBound) {
  auto r = parse::parseSource("x = " + nested('[', ']', 500, "") + "\n", "deep.py");
  ASSERT_TRUE(r.ok()) << r.errors.front().message;
  const ast::Expr* e = r.module->body[0]->as<ast::AssignStmt>().value.get();
  int levels = 0;
  while (const auto* list = e->getIf<ast::ListLiteral>()) {
    ++levels;
    if (list->elements.empty()) break;
    e = list->elements[0].get();
  }
  EXPECT_EQ(500, levels);
}

TEST(ParserNesting, BoundIsConfigurable) {
  const std::string src = "x = " + nested('(', ')', 60, "1") + "\n";
  auto r = parseWithDepth(src, 50);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(nullptr, r.module);
  EXPECT_EQ("too many nested parentheses", r.errors.front().message);
  EXPECT_EQ(parse::ErrorKind::InvalidSyntax, r.errors.front().kind);

  EXPECT_TRUE(parseWithDepth("x = " + nested('(', ')', 40, "1") + "\n", 50).ok());
}

TEST(ParserNesting, DepthErrorReportedOnce) {
  auto r = parseWithDepth("a = " + nested('[', ']', 30, "") + "\nb = " + nested('[', ']', 30, "") + "\n", 10);
  ASSERT_EQ(1u, r.errors.size());
  EXPECT_EQ(1, r.errors.front().line);
}

TEST(ParserNesting, NestedLambdas) {
  std::string src = "f = ";
  for (int i = 0; i < 30; ++i) src += "lambda: ";
  src += "0\n";
  EXPECT_TRUE(parseWithDepth(src, 100).ok());
  auto r = parseWithDepth(src, 10);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ("expression nested too deeply", r.errors.front().message);
}

TEST(ParserNesting, DefaultBoundFitsMainThreadStack) {
  EXPECT_EQ(parse::kDefaultMaxNestingDepth, parse::ParserOptions{}.maxNestingDepth);
  EXPECT_TRUE(parse::parseSource("x = " + nested('(', ')', 990, "1") + "\n", "deep.py").ok());

  auto r = parse::parseSource("x = " + nested('(', ')', 1100, "1") + "\n", "deep.py");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ("too many nested parentheses", r.errors.front().message);
}
