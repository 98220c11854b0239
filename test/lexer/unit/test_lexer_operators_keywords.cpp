/***
 * Name: test_lexer_operators_keywords
 * Purpose: Maximal-munch operators, keywords versus soft keywords, and
 *   invalid characters.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "lexer/Lexer.h"

using namespace pyrite;
using TK = lex::TokenKind;

static std::vector<TK> kindsNoLayout(const std::string& src) {
  lex::LexerOptions opts;
  opts.implicitJoin = true;
  std::vector<TK> out;
  for (const auto& t : lex::tokenize(src, "o.py", opts).tokens) out.push_back(t.kind);
  return out;
}

TEST(LexerOps, MaximalMunch) {
  const std::vector<TK> expected{TK::StarStarEqual, TK::StarStar, TK::Star, TK::SlashSlashEqual, TK::SlashSlash,
                                 TK::Slash, TK::RShiftEqual, TK::RShift, TK::Ge, TK::Gt, TK::Ellipsis, TK::Dot,
                                 TK::Arrow, TK::ColonEqual, TK::Colon, TK::NotEq, TK::EqEq, TK::Equal, TK::End};
  EXPECT_EQ(expected, kindsNoLayout("**= ** * //= // / >>= >> >= > ... . -> := : != == ="));
}

TEST(LexerOps, AugmentedAssignmentKinds) {
  const std::vector<TK> aug{TK::PlusEqual, TK::MinusEqual, TK::StarEqual, TK::StarStarEqual, TK::SlashEqual,
                            TK::SlashSlashEqual, TK::PercentEqual, TK::AtEqual, TK::AmpEqual, TK::PipeEqual,
                            TK::CaretEqual, TK::LShiftEqual, TK::RShiftEqual};
  for (const auto k : aug) EXPECT_TRUE(lex::isAugAssign(k)) << lex::to_string(k);
  EXPECT_FALSE(lex::isAugAssign(TK::Equal));
  EXPECT_FALSE(lex::isAugAssign(TK::EqEq));
  EXPECT_FALSE(lex::isAugAssign(TK::ColonEqual));
}

TEST(LexerOps, KeywordsAndSoftKeywords) {
  const std::vector<TK> expected{TK::Async, TK::Await, TK::None, TK::True, TK::False, TK::Lambda, TK::Nonlocal,
                                 TK::Ident, TK::Ident, TK::Ident, TK::Ident, TK::End};
  EXPECT_EQ(expected, kindsNoLayout("async await None True False lambda nonlocal match case _ type"));
}

TEST(LexerOps, KeywordsAreCaseSensitive) {
  const std::vector<TK> expected{TK::Ident, TK::Ident, TK::Ident, TK::End};
  EXPECT_EQ(expected, kindsNoLayout("none true If"));
}

TEST(LexerOps, KindNames) {
  EXPECT_STREQ("Newline", lex::to_string(TK::Newline));
  EXPECT_STREQ("Indent", lex::to_string(TK::Indent));
  EXPECT_STREQ("Ident", lex::to_string(TK::Ident));
  EXPECT_STREQ("Int", lex::to_string(TK::Int));
  EXPECT_STREQ("End", lex::to_string(TK::End));
}

TEST(LexerOps, InvalidCharacterReportedAndSkipped) {
  auto r = lex::tokenize("a $ b\n", "o.py");
  ASSERT_EQ(1u, r.errors.size());
  EXPECT_EQ("invalid character '$' (U+0024)", r.errors[0].message);
  EXPECT_EQ(1, r.errors[0].line);
  EXPECT_EQ(3, r.errors[0].col);
  EXPECT_EQ("o.py", r.errors[0].file);
  ASSERT_GE(r.tokens.size(), 3u);
  EXPECT_EQ(TK::Error, r.tokens[1].kind);
  EXPECT_EQ("b", r.tokens[2].text);
}

TEST(LexerOps, TokenPositions) {
  auto r = lex::tokenize("def f(a):\n    return a**2\n", "o.py");
  EXPECT_TRUE(r.errors.empty());
  const lex::Token* star = nullptr;
  for (const auto& t : r.tokens) {
    if (t.kind == TK::StarStar) star = &t;
  }
  ASSERT_NE(nullptr, star);
  EXPECT_EQ(2, star->line);
  EXPECT_EQ(13, star->col);
  EXPECT_EQ(15, star->endCol);
  EXPECT_EQ("o.py", star->file);
}

TEST(LexerOps, StreamInterface) {
  lex::Lexer lexer("x = 1\n", "o.py");
  EXPECT_EQ(TK::Ident, lexer.peek().kind);
  EXPECT_EQ(TK::Equal, lexer.peek(1).kind);
  EXPECT_EQ(TK::Ident, lexer.next().kind);
  EXPECT_EQ(TK::Equal, lexer.next().kind);
  EXPECT_EQ(TK::Int, lexer.next().kind);
  EXPECT_EQ(TK::Newline, lexer.next().kind);
  EXPECT_EQ(TK::End, lexer.next().kind);
  EXPECT_EQ(TK::End, lexer.next().kind);
  EXPECT_TRUE(lexer.lexErrors().empty());
}
