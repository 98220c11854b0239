/***
 * Name: test_lexer_unicode_ident
 * Purpose: Non-ASCII identifiers, NFKC normalization and code-point columns.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"

using namespace pyrite;
using TK = lex::TokenKind;

TEST(LexerUnicode, NonAsciiIdentifier) {
  auto r = lex::tokenize("caf\xC3\xA9 = 1\n", "u.py");
  EXPECT_TRUE(r.errors.empty());
  EXPECT_EQ(TK::Ident, r.tokens[0].kind);
  EXPECT_EQ("caf\xC3\xA9", r.tokens[0].text);
  // columns count code points, not bytes
  EXPECT_EQ(6, r.tokens[1].col);
}

TEST(LexerUnicode, GreekIdentifiers) {
  auto r = lex::tokenize("\xCE\xB1\xCE\xB2 + \xCE\xB3\n", "u.py");
  EXPECT_TRUE(r.errors.empty());
  EXPECT_EQ(TK::Ident, r.tokens[0].kind);
  EXPECT_EQ(TK::Plus, r.tokens[1].kind);
  EXPECT_EQ(4, r.tokens[1].col);
  EXPECT_EQ(TK::Ident, r.tokens[2].kind);
}

TEST(LexerUnicode, NfkcNormalization) {
  // U+FB01 LATIN SMALL LIGATURE FI
  auto r = lex::tokenize("\xEF\xAC\x81nd = 1\n", "u.py");
  EXPECT_TRUE(r.errors.empty());
  EXPECT_EQ(TK::Ident, r.tokens[0].kind);
  EXPECT_EQ("find", r.tokens[0].text);
}

TEST(LexerUnicode, InvalidCharacter) {
  auto r = lex::tokenize("x = \xE2\x82\xAC\n", "u.py");
  ASSERT_EQ(1u, r.errors.size());
  EXPECT_EQ("invalid character '\xE2\x82\xAC' (U+20AC)", r.errors[0].message);
  EXPECT_EQ(5, r.errors[0].col);
}

TEST(LexerUnicode, ByteOrderMarkSkipped) {
  auto r = lex::tokenize("\xEF\xBB\xBFx = 1\n", "u.py");
  EXPECT_TRUE(r.errors.empty());
  EXPECT_EQ("x", r.tokens[0].text);
  EXPECT_EQ(1, r.tokens[0].col);
}
