/***
 * Name: test_parser_control_flow
 * Purpose: Compound statements: if/elif/else, loops, try, with, and the
 *   block structure diagnostics.
 */
#include <gtest/gtest.h>
#include <string>
#include "ast/Nodes.h"
#include "parser/Parser.h"

using namespace pyrite;

static parse::ParseResult parseText(const std::string& src) { return parse::parseSource(src, "t.py"); }

static std::string firstMessage(const parse::ParseResult& r) {
  return r.errors.empty() ? std::string() : r.errors.front().message;
}

TEST(ParserControl, IfElifElseChain) {
  const char* src =
      "if a:\n"
      "    x = 1\n"
      "elif b:\n"
      "    x = 2\n"
      "elif c:\n"
      "    pass\n"
      "else:\n"
      "    x = 3\n";
  auto r = parseText(src);
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  ASSERT_EQ(1u, r.module->body.size());
  const auto& top = r.module->body[0]->as<ast::IfStmt>();
  EXPECT_EQ("a", top.test->as<ast::Name>().id);
  ASSERT_EQ(1u, top.orelse.size());
  const auto& elif1 = top.orelse[0]->as<ast::IfStmt>();
  EXPECT_EQ(3, top.orelse[0]->span.line);
  const auto& elif2 = elif1.orelse[0]->as<ast::IfStmt>();
  EXPECT_EQ("c", elif2.test->as<ast::Name>().id);
  ASSERT_EQ(1u, elif2.orelse.size());
  EXPECT_TRUE(elif2.orelse[0]->is<ast::AssignStmt>());
}

TEST(ParserControl, LoopsWithElse) {
  const char* src =
      "while x > 0:\n"
      "    x -= 1\n"
      "    if x == 5: break\n"
      "else:\n"
      "    pass\n"
      "for i, (a, b) in enumerate(pairs):\n"
      "    continue\n"
      "else:\n"
      "    done = True\n";
  auto r = parseText(src);
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  ASSERT_EQ(2u, r.module->body.size());
  const auto& loop = r.module->body[0]->as<ast::WhileStmt>();
  EXPECT_EQ(2u, loop.body.size());
  EXPECT_EQ(1u, loop.orelse.size());
  const auto& inlineIf = loop.body[1]->as<ast::IfStmt>();
  EXPECT_TRUE(inlineIf.body[0]->is<ast::BreakStmt>());

  const auto& forLoop = r.module->body[1]->as<ast::ForStmt>();
  const auto& target = forLoop.target->as<ast::TupleLiteral>();
  EXPECT_EQ(ast::ExprContext::Store, target.ctx);
  EXPECT_EQ(ast::ExprContext::Store, target.elements[1]->as<ast::TupleLiteral>().ctx);
  EXPECT_TRUE(forLoop.iter->is<ast::Call>());
  EXPECT_EQ(1u, forLoop.orelse.size());
}

TEST(ParserControl, TryExceptElseFinally) {
  const char* src =
      "try:\n"
      "    risky()\n"
      "except (KeyError, ValueError) as e:\n"
      "    handle(e)\n"
      "except OSError:\n"
      "    pass\n"
      "except:\n"
      "    raise\n"
      "else:\n"
      "    ok()\n"
      "finally:\n"
      "    cleanup()\n";
  auto r = parseText(src);
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& stmt = r.module->body[0]->as<ast::TryStmt>();
  ASSERT_EQ(3u, stmt.handlers.size());
  EXPECT_TRUE(stmt.handlers[0].type->is<ast::TupleLiteral>());
  EXPECT_EQ("e", stmt.handlers[0].name);
  EXPECT_EQ("", stmt.handlers[1].name);
  EXPECT_EQ(nullptr, stmt.handlers[2].type);
  EXPECT_TRUE(stmt.handlers[2].body[0]->is<ast::RaiseStmt>());
  EXPECT_EQ(1u, stmt.orelse.size());
  EXPECT_EQ(1u, stmt.finalbody.size());
}

TEST(ParserControl, TryErrors) {
  auto bare = parseText("try:\n    pass\nexcept:\n    pass\nexcept E:\n    pass\n");
  ASSERT_FALSE(bare.ok());
  EXPECT_EQ("default 'except:' must be last", firstMessage(bare));
  EXPECT_EQ(3, bare.errors[0].line);

  auto multi = parseText("try:\n    pass\nexcept A, B:\n    pass\n");
  ASSERT_FALSE(multi.ok());
  EXPECT_EQ("multiple exception types must be parenthesized", firstMessage(multi));

  auto alone = parseText("try:\n    pass\nx = 1\n");
  ASSERT_FALSE(alone.ok());
  EXPECT_EQ("expected 'except' or 'finally' block", firstMessage(alone));
}

TEST(ParserControl, WithStatements) {
  const char* src =
      "with open(a) as f, lock:\n"
      "    pass\n"
      "with (open(a) as f,\n"
      "      open(b) as (g, h),):\n"
      "    pass\n"
      "async def run():\n"
      "    async with s as t:\n"
      "        async for x in t:\n"
      "            pass\n";
  auto r = parseText(src);
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& first = r.module->body[0]->as<ast::WithStmt>();
  ASSERT_EQ(2u, first.items.size());
  EXPECT_EQ(ast::ExprContext::Store, first.items[0].optionalVars->as<ast::Name>().ctx);
  EXPECT_EQ(nullptr, first.items[1].optionalVars);

  const auto& second = r.module->body[1]->as<ast::WithStmt>();
  ASSERT_EQ(2u, second.items.size());
  EXPECT_TRUE(second.items[1].optionalVars->is<ast::TupleLiteral>());

  const auto& fn = r.module->body[2]->as<ast::FunctionDef>();
  const auto& asyncWith = fn.body[0]->as<ast::WithStmt>();
  EXPECT_TRUE(asyncWith.isAsync);
  EXPECT_TRUE(asyncWith.body[0]->as<ast::ForStmt>().isAsync);
}

TEST(ParserControl, ParenthesizedExpressionIsNotItemList) {
  auto r = parseText("with (a, b) as c:\n    pass\n");
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& stmt = r.module->body[0]->as<ast::WithStmt>();
  ASSERT_EQ(1u, stmt.items.size());
  EXPECT_TRUE(stmt.items[0].contextExpr->is<ast::TupleLiteral>());
}

TEST(ParserControl, SimpleStatementsOnOneLine) {
  auto r = parseText("if x: a = 1; b = 2;\nimport os; pass\n");
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  ASSERT_EQ(3u, r.module->body.size());
  EXPECT_EQ(2u, r.module->body[0]->as<ast::IfStmt>().body.size());
}

TEST(ParserControl, SmallStatements) {
  const char* src =
      "def f():\n"
      "    global a, b\n"
      "    nonlocal c\n"
      "    assert a, 'msg'\n"
      "    raise E from err\n"
      "    return 1, *rest\n"
      "    return\n";
  auto r = parseText(src);
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& body = r.module->body[0]->as<ast::FunctionDef>().body;
  ASSERT_EQ(6u, body.size());
  EXPECT_EQ(2u, body[0]->as<ast::GlobalStmt>().names.size());
  EXPECT_EQ("c", body[1]->as<ast::NonlocalStmt>().names[0]);
  EXPECT_NE(nullptr, body[2]->as<ast::AssertStmt>().msg);
  EXPECT_NE(nullptr, body[3]->as<ast::RaiseStmt>().cause);
  EXPECT_TRUE(body[4]->as<ast::ReturnStmt>().value->is<ast::TupleLiteral>());
  EXPECT_EQ(nullptr, body[5]->as<ast::ReturnStmt>().value);
}

TEST(ParserControl, MissingIndentedBlock) {
  auto r = parseText("if x:\npass\n");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ("expected an indented block after 'if' statement", firstMessage(r));
  EXPECT_EQ(parse::ErrorKind::InconsistentIndentation, r.errors[0].kind);
  EXPECT_EQ(2, r.errors[0].line);

  auto eof = parseText("for x in y:\n");
  ASSERT_FALSE(eof.ok());
  EXPECT_EQ("expected an indented block after 'for' statement", firstMessage(eof));
  EXPECT_EQ(parse::ErrorKind::UnexpectedEof, eof.errors[0].kind);
}

TEST(ParserControl, UnexpectedIndent) {
  auto r = parseText("x = 1\n    y = 2\nz = 3\n");
  ASSERT_EQ(1u, r.errors.size());
  EXPECT_EQ("unexpected indent", r.errors[0].message);
  EXPECT_EQ(parse::ErrorKind::InconsistentIndentation, r.errors[0].kind);
  EXPECT_EQ(2, r.errors[0].line);
}

TEST(ParserControl, JunkAfterStatement) {
  auto r = parseText("x = 1 2\n");
  ASSERT_EQ(1u, r.errors.size());
  EXPECT_EQ("invalid syntax", r.errors[0].message);
  EXPECT_EQ(parse::ErrorKind::UnexpectedToken, r.errors[0].kind);
  EXPECT_EQ(7, r.errors[0].col);
}
