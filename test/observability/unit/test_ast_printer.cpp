/***
 * Name: test_ast_printer
 * Purpose: Snapshot checks of the indented AST dump and node labels.
 */
#include <gtest/gtest.h>
#include <string>
#include "observability/AstPrinter.h"
#include "parser/Parser.h"

using namespace pyrite;

static std::string dump(const std::string& src) {
  auto r = parse::parseSource(src, "p.py");
  EXPECT_TRUE(r.ok());
  if (!r.module) return {};
  obs::AstPrinter printer;
  return printer.print(*r.module);
}

TEST(AstPrinter, AssignmentWithCall) {
  const std::string expected =
      "Module\n"
      "  Assign\n"
      "    Name id=x ctx=Store\n"
      "    Call keywords=k,**\n"
      "      Name id=f ctx=Load\n"
      "      Constant Int 1\n"
      "      Constant Int 2\n"
      "      Name id=d ctx=Load\n";
  EXPECT_EQ(expected, dump("x = f(1, k=2, **d)\n"));
}

TEST(AstPrinter, FunctionParameters) {
  const std::string expected =
      "Module\n"
      "  FunctionDef name=f params=a,/,b,*args,c,**kw\n"
      "    Return\n"
      "      Name id=a ctx=Load\n";
  EXPECT_EQ(expected, dump("def f(a, /, b, *args, c, **kw):\n    return a\n"));
  EXPECT_EQ("Module\n  AsyncFunctionDef name=g params=*,k\n    Pass\n", dump("async def g(*, k): pass\n"));
}

TEST(AstPrinter, ImportsAndScopes) {
  const std::string expected =
      "Module\n"
      "  Import names=a.b as c,d\n"
      "  ImportFrom module=m level=1 names=x\n"
      "  Global names=g,h\n";
  EXPECT_EQ(expected, dump("import a.b as c, d\nfrom .m import x\nglobal g, h\n"));
}

TEST(AstPrinter, MatchStatement) {
  const std::string expected =
      "Module\n"
      "  Match cases=1\n"
      "    Name id=p ctx=Load\n"
      "    MatchSequence list\n"
      "      MatchCapture name=x\n"
      "      MatchStar name=rest\n"
      "    Pass\n";
  EXPECT_EQ(expected, dump("match p:\n    case [x, *rest]: pass\n"));
}

TEST(AstPrinter, StatementLabels) {
  const std::string expected =
      "Module\n"
      "  AnnAssign simple\n"
      "    Name id=n ctx=Store\n"
      "    Name id=int ctx=Load\n"
      "  AugAssign op=//\n"
      "    Name id=n ctx=Store\n"
      "    Constant Int 2\n"
      "  Try handlers=1\n"
      "    Pass\n"
      "    Pass\n";
  EXPECT_EQ(expected, dump("n: int\nn //= 2\ntry:\n    pass\nexcept:\n    pass\n"));
}

TEST(AstPrinter, SingleExpression) {
  auto r = parse::parseSource("a < b <= 'c'\n", "p.py");
  ASSERT_TRUE(r.ok());
  obs::AstPrinter printer;
  const std::string expected =
      "Compare ops=<,<=\n"
      "  Name id=a ctx=Load\n"
      "  Name id=b ctx=Load\n"
      "  Constant Str \"c\"\n";
  EXPECT_EQ(expected, printer.print(*r.module->body[0]->as<ast::ExprStmt>().value));
}

TEST(AstPrinter, FStringLabel) {
  const std::string expected =
      "Module\n"
      "  Expr\n"
      "    FString \"{!r:}y\"\n"
      "      Name id=x ctx=Load\n"
      "      FString \">3\"\n";
  EXPECT_EQ(expected, dump("f'{x!r:>3}y'\n"));
}

TEST(AstPrinter, PrinterIsReusable) {
  auto r = parse::parseSource("pass\n", "p.py");
  ASSERT_TRUE(r.ok());
  obs::AstPrinter printer;
  const std::string first = printer.print(*r.module);
  EXPECT_EQ(first, printer.print(*r.module));
  EXPECT_EQ("Module\n  Pass\n", first);
}
