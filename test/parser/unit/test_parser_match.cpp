/***
 * Name: test_parser_match
 * Purpose: match/case statements, soft keyword detection and structural
 *   pattern forms.
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

// Parse "match s:\n    case <pattern>: pass\n" and return the case pattern.
static parse::ParseResult parseCase(const std::string& pattern) {
  return parseText("match s:\n    case " + pattern + ": pass\n");
}

static const ast::Pattern& patternOf(const parse::ParseResult& r) {
  return *r.module->body.at(0)->as<ast::MatchStmt>().cases.at(0).pattern;
}

TEST(ParserMatch, CasesAndGuards) {
  const char* src =
      "match command.split():\n"
      "    case [\"go\", direction] if direction in exits:\n"
      "        move(direction)\n"
      "    case [\"quit\"]:\n"
      "        quit()\n"
      "    case _:\n"
      "        pass\n";
  auto r = parseText(src);
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& stmt = r.module->body[0]->as<ast::MatchStmt>();
  EXPECT_TRUE(stmt.subject->is<ast::Call>());
  ASSERT_EQ(3u, stmt.cases.size());
  EXPECT_NE(nullptr, stmt.cases[0].guard);
  EXPECT_EQ(nullptr, stmt.cases[1].guard);
  const auto& seq = stmt.cases[0].pattern->as<ast::PatternSequence>();
  EXPECT_TRUE(seq.isList);
  ASSERT_EQ(2u, seq.elements.size());
  EXPECT_TRUE(seq.elements[0]->is<ast::PatternValue>());
  EXPECT_EQ("direction", seq.elements[1]->as<ast::PatternName>().name);
  EXPECT_TRUE(stmt.cases[2].pattern->is<ast::PatternWildcard>());
}

TEST(ParserMatch, SoftKeywordsStayNames) {
  const char* src =
      "match = 1\n"
      "match(x)\n"
      "case = match.group\n"
      "_ = [match, case]\n";
  auto r = parseText(src);
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  ASSERT_EQ(4u, r.module->body.size());
  EXPECT_TRUE(r.module->body[0]->is<ast::AssignStmt>());
  EXPECT_TRUE(r.module->body[1]->as<ast::ExprStmt>().value->is<ast::Call>());
  EXPECT_TRUE(r.module->body[2]->is<ast::AssignStmt>());
}

TEST(ParserMatch, TupleSubject) {
  auto r = parseText("match a, *b:\n    case (x, *rest): pass\n");
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& stmt = r.module->body[0]->as<ast::MatchStmt>();
  EXPECT_EQ(2u, stmt.subject->as<ast::TupleLiteral>().elements.size());
  const auto& seq = stmt.cases[0].pattern->as<ast::PatternSequence>();
  EXPECT_FALSE(seq.isList);
  EXPECT_EQ("rest", seq.elements[1]->as<ast::PatternStar>().name.value_or(""));
}

TEST(ParserMatch, OpenSequenceAndStarWildcard) {
  auto r = parseCase("1, *_, 2");
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& seq = patternOf(r).as<ast::PatternSequence>();
  EXPECT_FALSE(seq.isList);
  ASSERT_EQ(3u, seq.elements.size());
  EXPECT_FALSE(seq.elements[1]->as<ast::PatternStar>().name.has_value());
}

TEST(ParserMatch, LiteralValues) {
  auto negative = parseCase("-1");
  ASSERT_TRUE(negative.ok()) << firstMessage(negative);
  EXPECT_TRUE(patternOf(negative).as<ast::PatternValue>().value->is<ast::Unary>());

  auto complex = parseCase("-1 + 2j");
  ASSERT_TRUE(complex.ok()) << firstMessage(complex);
  const auto& sum = patternOf(complex).as<ast::PatternValue>().value->as<ast::Binary>();
  EXPECT_EQ(ast::BinaryOperator::Add, sum.op);
  EXPECT_TRUE(sum.left->is<ast::Unary>());
  EXPECT_EQ(ast::Constant::Kind::Imag, sum.right->as<ast::Constant>().kind);

  auto dotted = parseCase("Color.RED");
  ASSERT_TRUE(dotted.ok()) << firstMessage(dotted);
  EXPECT_EQ("RED", patternOf(dotted).as<ast::PatternValue>().value->as<ast::Attribute>().attr);

  auto none = parseCase("None | 'a' 'b'");
  ASSERT_TRUE(none.ok()) << firstMessage(none);
  const auto& alternatives = patternOf(none).as<ast::PatternOr>();
  ASSERT_EQ(2u, alternatives.patterns.size());
  EXPECT_EQ("ab", alternatives.patterns[1]->as<ast::PatternValue>().value->as<ast::Constant>().text);
}

TEST(ParserMatch, GroupsAndAsPatterns) {
  auto r = parseCase("(1 | 2) as n");
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& as = patternOf(r).as<ast::PatternAs>();
  EXPECT_EQ("n", as.name);
  EXPECT_TRUE(as.pattern->is<ast::PatternOr>());

  auto empty = parseCase("()");
  ASSERT_TRUE(empty.ok());
  EXPECT_TRUE(patternOf(empty).as<ast::PatternSequence>().elements.empty());

  auto single = parseCase("(x,)");
  ASSERT_TRUE(single.ok());
  EXPECT_EQ(1u, patternOf(single).as<ast::PatternSequence>().elements.size());
}

TEST(ParserMatch, MappingPatterns) {
  auto r = parseCase("{'x': 1, Key.Y: [a, b], **rest}");
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& mapping = patternOf(r).as<ast::PatternMapping>();
  EXPECT_EQ(2u, mapping.keys.size());
  EXPECT_EQ(2u, mapping.patterns.size());
  ASSERT_TRUE(mapping.rest.has_value());
  EXPECT_EQ("rest", *mapping.rest);
}

TEST(ParserMatch, ClassPatterns) {
  auto r = parseCase("Point(0, y=yy, z=_)");
  ASSERT_TRUE(r.ok()) << firstMessage(r);
  const auto& cls = patternOf(r).as<ast::PatternClass>();
  EXPECT_EQ("Point", cls.cls->as<ast::Name>().id);
  EXPECT_EQ(1u, cls.args.size());
  ASSERT_EQ(2u, cls.kwdNames.size());
  EXPECT_EQ("y", cls.kwdNames[0]);
  EXPECT_TRUE(cls.kwdPatterns[1]->is<ast::PatternWildcard>());
}

TEST(ParserMatch, PatternErrors) {
  struct Case {
    const char* pattern;
    const char* message;
  };
  const Case cases[] = {
      {"[*a, *b]", "multiple starred names in sequence pattern"},
      {"*a", "star pattern cannot be used here"},
      {"{**r, 'k': 1}", "double star pattern must be last in a mapping pattern"},
      {"{k: 1}", "mapping pattern keys may only match literals and attribute lookups"},
      {"P(a=1, a=2)", "attribute name repeated in class pattern: a"},
      {"P(a=1, b)", "positional patterns follow keyword patterns"},
      {"x as _", "cannot use '_' as a target"},
      {"f'{x}'", "patterns may only match literals and attribute lookups"},
      {"1 + 2", "imaginary number required in complex literal"},
      {"1j + 2j", "real number required in complex literal"},
  };
  for (const auto& c : cases) {
    auto r = parseCase(c.pattern);
    ASSERT_FALSE(r.ok()) << c.pattern;
    EXPECT_EQ(c.message, firstMessage(r)) << c.pattern;
  }
}

TEST(ParserMatch, BodyMustContainCases) {
  auto r = parseText("match x:\n    y = 1\n");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ("expected 'case'", firstMessage(r));
}
