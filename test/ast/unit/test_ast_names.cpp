/***
 * Name: test_ast_names
 * Purpose: Stable spellings of operators, contexts and node kinds.
 */
#include <gtest/gtest.h>
#include <string>
#include "ast/Nodes.h"
#include "parser/Parser.h"

using namespace pyrite;

TEST(AstNames, Operators) {
  EXPECT_STREQ("//", ast::to_string(ast::BinaryOperator::FloorDiv));
  EXPECT_STREQ("@", ast::to_string(ast::BinaryOperator::MatMul));
  EXPECT_STREQ("is not", ast::to_string(ast::BinaryOperator::IsNot));
  EXPECT_STREQ("not in", ast::to_string(ast::BinaryOperator::NotIn));
  EXPECT_STREQ("and", ast::to_string(ast::BinaryOperator::And));
  EXPECT_STREQ("not", ast::to_string(ast::UnaryOperator::Not));
  EXPECT_STREQ("~", ast::to_string(ast::UnaryOperator::BitNot));
}

TEST(AstNames, ContextsAndConstants) {
  EXPECT_STREQ("Store", ast::to_string(ast::ExprContext::Store));
  EXPECT_STREQ("Del", ast::to_string(ast::ExprContext::Del));
  EXPECT_STREQ("Ellipsis", ast::to_string(ast::Constant::Kind::Ellipsis));
  EXPECT_STREQ("Imag", ast::to_string(ast::Constant::Kind::Imag));
  EXPECT_STREQ("GeneratorExp", ast::to_string(ast::ComprehensionKind::Generator));
}

TEST(AstNames, KindNamesFollowParsedShapes) {
  const char* src =
      "async def f():\n"
      "    await g()\n"
      "    del a[0]\n"
      "    nonlocal n\n"
      "x += {k: v for k, v in items}\n";
  auto r = parse::parseSource(src, "n.py");
  ASSERT_TRUE(r.ok()) << r.errors.front().message;
  const auto& def = r.module->body[0]->as<ast::FunctionDef>();
  EXPECT_TRUE(def.isAsync);
  EXPECT_STREQ("FunctionDef", ast::kindName(*r.module->body[0]));
  EXPECT_STREQ("Await", ast::kindName(*def.body[0]->as<ast::ExprStmt>().value));
  EXPECT_STREQ("Delete", ast::kindName(*def.body[1]));
  EXPECT_STREQ("Nonlocal", ast::kindName(*def.body[2]));
  const auto& aug = r.module->body[1]->as<ast::AugAssignStmt>();
  EXPECT_STREQ("AugAssign", ast::kindName(*r.module->body[1]));
  EXPECT_STREQ("DictComp", ast::kindName(*aug.value));
}

TEST(AstNames, PatternKinds) {
  auto r = parse::parseSource("match p:\n    case {'a': 1} | C() | [*_] as q: pass\n", "n.py");
  ASSERT_TRUE(r.ok()) << r.errors.front().message;
  const auto& as = r.module->body[0]->as<ast::MatchStmt>().cases[0].pattern->as<ast::PatternAs>();
  const auto& alternatives = as.pattern->as<ast::PatternOr>().patterns;
  EXPECT_STREQ("MatchMapping", ast::kindName(*alternatives[0]));
  EXPECT_STREQ("MatchClass", ast::kindName(*alternatives[1]));
  EXPECT_STREQ("MatchSequence", ast::kindName(*alternatives[2]));
}
