/**
 * Name: pyrite::lex::Lexer
 * Purpose: Tokenize one in-memory source buffer into a token stream plus a
 *   list of lexical errors.
 * Theory of Operation:
 *   The whole buffer is scanned on first use (eager tokenization buffer) and
 *   then served through ITokenStream. Scanning never stops on malformed input:
 *   problems are appended to errors() and a best-effort or Error token is
 *   emitted. Block structure is derived from an indentation stack measured
 *   with the configured tab width, each level also remembering its width at
 *   tab width 1; disagreement between the two measures is an inconsistent
 *   tab/space mix.
 *   Open brackets are tracked on their own stack for implicit line joining.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "lexer/ITokenStream.h"
#include "lexer/LexError.h"
#include "lexer/LexerOptions.h"

namespace pyrite::lex {

class Lexer : public ITokenStream {
public:
    Lexer(std::string source, std::string file, LexerOptions options = {});

    // ITokenStream
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    std::vector<LexError> lexErrors() override;

    const std::vector<Token>& tokens();
    const std::vector<LexError>& errors();

private:
    std::string src_;
    std::string file_;
    LexerOptions opts_;

    // Eager tokenization buffer to simplify streaming semantics safely
    bool finalized_{false};
    std::vector<Token> tokens_{};
    std::vector<LexError> errors_{};
    size_t cursor_{0}; // stream position in tokens_

    // scanning state
    size_t pos_{0}; // byte offset into src_
    int line_{1};
    int col_{1};
    bool atLineStart_{true};
    struct IndentLevel {
        int width{0}; // measured with opts_.tabWidth
        int altWidth{0}; // measured with tab width 1
        bool silent{false}; // pushed after a bad dedent; no INDENT/DEDENT emitted
    };
    std::vector<IndentLevel> indentStack_{}; // bottom level (width 0) pushed by the constructor
    std::vector<char> brackets_{}; // open ( [ { awaiting their closer

    // cursor helpers
    char cur(size_t ahead = 0) const;
    bool atEnd() const { return pos_ >= src_.size(); }
    bool atNewline() const { return cur() == '\n' || cur() == '\r'; }
    void advance(); // consume one byte (CRLF as one line break)

    void error(LexErrorKind kind, int line, int col, std::string message);
    Token& emit(TokenKind kind, size_t start, int line, int col);

    void buildAll(); // build tokens_ from src_
    bool handleLineStart(); // indentation; false when the line is blank
    void closeBlocks();
    void scanToken();
    void scanOperator();
    void scanNumber();
    void scanIdentifierOrString();
    void scanString(size_t start, int line, int col, std::string_view prefix);

    // number helpers
    void scanDigitRun(bool (*isDigit)(char), const char* kind, std::string& digits, std::string& problem);
    void skipIdentifierTail();

    // string helpers (LexString.cpp)
    std::string decodeEscapes(std::string_view body, int line, int col, const StringFlags& flags);
    std::vector<FStringPart> splitFString(std::string_view body, int line, int col,
                              const StringFlags& flags);
};

} // namespace pyrite::lex
