/***
 * Name: test_lexer_strings
 * Purpose: String and bytes literals: prefixes, escapes, triple quotes and
 *   unterminated-literal recovery.
 */
#include <gtest/gtest.h>
#include <string>
#include <variant>
#include "lexer/Lexer.h"

using namespace pyrite;
using TK = lex::TokenKind;

static std::string valueOf(const lex::Token& t) {
  const auto* p = std::get_if<lex::StringPayload>(&t.value);
  return p ? p->value : std::string("<none>");
}

TEST(LexerStrings, QuotesAndEscapes) {
  auto r = lex::tokenize("'abc' \"d\\ne\" 'it\\'s' '\\x41\\u00e9\\101'", "s.py");
  EXPECT_TRUE(r.errors.empty());
  EXPECT_EQ(TK::String, r.tokens[0].kind);
  EXPECT_EQ("abc", valueOf(r.tokens[0]));
  EXPECT_EQ("'abc'", r.tokens[0].text);
  EXPECT_EQ("d\ne", valueOf(r.tokens[1]));
  EXPECT_EQ("it's", valueOf(r.tokens[2]));
  EXPECT_EQ("A\xC3\xA9" "A", valueOf(r.tokens[3]));
}

TEST(LexerStrings, UnknownEscapeKeptVerbatim) {
  auto r = lex::tokenize("'\\z'", "s.py");
  EXPECT_TRUE(r.errors.empty());
  EXPECT_EQ("\\z", valueOf(r.tokens[0]));
}

TEST(LexerStrings, NamedUnicodeEscape) {
  auto r = lex::tokenize("'\\N{LATIN SMALL LETTER A}\\N{EURO SIGN}'", "s.py");
  EXPECT_TRUE(r.errors.empty());
  EXPECT_EQ("a\xE2\x82\xAC", valueOf(r.tokens[0]));
}

TEST(LexerStrings, RawStringsKeepBackslashes) {
  auto r = lex::tokenize("r'\\n' R\"\\d+\"", "s.py");
  EXPECT_TRUE(r.errors.empty());
  EXPECT_EQ("\\n", valueOf(r.tokens[0]));
  EXPECT_EQ("\\d+", valueOf(r.tokens[1]));
  const auto* p = std::get_if<lex::StringPayload>(&r.tokens[0].value);
  ASSERT_NE(nullptr, p);
  EXPECT_TRUE(p->flags.raw);
}

TEST(LexerStrings, BytesLiterals) {
  auto r = lex::tokenize("b'\\x00A' rb'\\x'", "s.py");
  EXPECT_TRUE(r.errors.empty());
  EXPECT_EQ(TK::Bytes, r.tokens[0].kind);
  EXPECT_EQ(std::string("\0A", 2), valueOf(r.tokens[0]));
  EXPECT_EQ(TK::Bytes, r.tokens[1].kind);
  EXPECT_EQ("\\x", valueOf(r.tokens[1]));
}

TEST(LexerStrings, BytesRejectNonAscii) {
  auto r = lex::tokenize("b'\xC3\xA9'", "s.py");
  ASSERT_EQ(1u, r.errors.size());
  EXPECT_EQ("bytes can only contain ASCII literal characters", r.errors[0].message);
}

TEST(LexerStrings, TripleQuotedSpansLines) {
  auto r = lex::tokenize("x = '''a\nb'''\ny\n", "s.py");
  EXPECT_TRUE(r.errors.empty());
  EXPECT_EQ(TK::String, r.tokens[2].kind);
  EXPECT_EQ("a\nb", valueOf(r.tokens[2]));
  EXPECT_EQ(1, r.tokens[2].line);
  EXPECT_EQ(2, r.tokens[2].endLine);
  EXPECT_EQ(TK::Newline, r.tokens[3].kind);
  EXPECT_EQ("y", r.tokens[4].text);
  EXPECT_EQ(3, r.tokens[4].line);
}

TEST(LexerStrings, UnterminatedReportsOpeningQuote) {
  auto r = lex::tokenize("x = 'abc\ny = 1\n", "s.py");
  ASSERT_EQ(1u, r.errors.size());
  EXPECT_EQ(lex::LexErrorKind::UnterminatedLiteral, r.errors[0].kind);
  EXPECT_EQ("unterminated string literal", r.errors[0].message);
  EXPECT_EQ(1, r.errors[0].line);
  EXPECT_EQ(5, r.errors[0].col);
  // the literal still yields a token and the next line lexes normally
  EXPECT_EQ(TK::String, r.tokens[2].kind);
  EXPECT_EQ(TK::Newline, r.tokens[3].kind);
  EXPECT_EQ("y", r.tokens[4].text);
}

TEST(LexerStrings, UnterminatedTripleQuote) {
  auto r = lex::tokenize("s = \"\"\"never closed\n", "s.py");
  ASSERT_EQ(1u, r.errors.size());
  EXPECT_EQ("unterminated triple-quoted string literal", r.errors[0].message);
  EXPECT_EQ(5, r.errors[0].col);
}

TEST(LexerStrings, PrefixLettersWithoutQuoteAreNames) {
  auto r = lex::tokenize("rb br f u", "s.py");
  EXPECT_TRUE(r.errors.empty());
  for (int i = 0; i < 4; ++i) EXPECT_EQ(TK::Ident, r.tokens[i].kind);
}
