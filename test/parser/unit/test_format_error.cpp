/***
 * Name: test_format_error
 * Purpose: Rendering of diagnostics with the echoed source line and caret.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "parser/FormatError.h"
#include "parser/Parser.h"

using namespace pyrite;

static parse::ParseError makeError(const std::string& file, const int line, const int col) {
  parse::ParseError e;
  e.kind = parse::ErrorKind::UnexpectedToken;
  e.message = "expected expression";
  e.file = file;
  e.line = line;
  e.col = col;
  return e;
}

TEST(FormatError, HeaderLineAndCaret) {
  const std::string source = "a = 1\nb = )\n";
  EXPECT_EQ("t.py:2:5: UnexpectedToken: expected expression\nb = )\n    ^",
            parse::FormatError(makeError("t.py", 2, 5), source));
}

TEST(FormatError, UnnamedInput) {
  EXPECT_EQ("<input>:1:1: UnexpectedToken: expected expression\n)\n^", parse::FormatError(makeError("", 1, 1), ")"));
}

TEST(FormatError, LineOutOfRangeOmitsContext) {
  EXPECT_EQ("t.py:9:1: UnexpectedToken: expected expression", parse::FormatError(makeError("t.py", 9, 1), "x\n"));
}

TEST(FormatError, TabsExpand) {
  const std::string source = "\tx = )\n";
  EXPECT_EQ("t.py:1:6: UnexpectedToken: expected expression\n        x = )\n            ^",
            parse::FormatError(makeError("t.py", 1, 6), source));
  EXPECT_EQ("t.py:1:6: UnexpectedToken: expected expression\n    x = )\n        ^",
            parse::FormatError(makeError("t.py", 1, 6), source, 4));
}

TEST(FormatError, ColumnsCountCodePoints) {
  const std::string source = "\xC3\xA9 = )\r\n";
  EXPECT_EQ("t.py:1:5: UnexpectedToken: expected expression\n\xC3\xA9 = )\n    ^",
            parse::FormatError(makeError("t.py", 1, 5), source));
}

TEST(FormatError, BareCarriageReturnEndsLine) {
  EXPECT_EQ("t.py:2:5: UnexpectedToken: expected expression\nb = )\n    ^",
            parse::FormatError(makeError("t.py", 2, 5), "a = 1\rb = )\r"));
  const std::string mixed = "a = 1\r\nb = 2\rc = )\nd\n";
  EXPECT_EQ("t.py:3:5: UnexpectedToken: expected expression\nc = )\n    ^",
            parse::FormatError(makeError("t.py", 3, 5), mixed));
  EXPECT_EQ("t.py:4:1: UnexpectedToken: expected expression\nd\n^",
            parse::FormatError(makeError("t.py", 4, 1), mixed));
}

TEST(FormatError, CaretPastEndOfLine) {
  EXPECT_EQ("t.py:1:4: UnexpectedToken: expected expression\nab\n   ^",
            parse::FormatError(makeError("t.py", 1, 4), "ab\n"));
}

TEST(FormatError, JoinsMultipleErrors) {
  const std::string source = "x = = 1\ny = 2 +\n";
  auto r = parse::parseSource(source, "t.py");
  ASSERT_EQ(2u, r.errors.size());
  const std::string text = parse::FormatErrors(r.errors, source);
  EXPECT_EQ(parse::FormatError(r.errors[0], source) + "\n" + parse::FormatError(r.errors[1], source), text);
  EXPECT_EQ("", parse::FormatErrors({}, source));
}
