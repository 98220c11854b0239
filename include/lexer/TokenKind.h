/**
 * Name: pyrite::lex::TokenKind
 * Purpose: Token kinds for the lexer.
 */
#pragma once

namespace pyrite::lex {

enum class TokenKind {
    End, // EOF
    Newline, // logical line end
    Indent, // indentation increase
    Dedent, // indentation decrease
    Error, // unscannable span (diagnostic recorded separately)

    // keywords
    False, // False
    None, // None
    True, // True
    And, // and
    As, // as
    Assert, // assert
    Async, // async
    Await, // await
    Break, // break
    Class, // class
    Continue, // continue
    Def, // def
    Del, // del
    Elif, // elif
    Else, // else
    Except, // except
    Finally, // finally
    For, // for
    From, // from
    Global, // global
    If, // if
    Import, // import
    In, // in
    Is, // is
    Lambda, // lambda
    Nonlocal, // nonlocal
    Not, // not
    Or, // or
    Pass, // pass
    Raise, // raise
    Return, // return
    Try, // try
    While, // while
    With, // with
    Yield, // yield

    Ident, // identifier (soft keywords match/case/_ included)
    Int, // integer literal
    Float, // float literal
    Imag, // imaginary numeric (e.g., 1j)
    String, // str literal
    Bytes, // b'...'
    FString, // f'...'

    Plus, // +
    Minus, // -
    Star, // *
    StarStar, // ** (power)
    Slash, // /
    SlashSlash, // // (floor-div)
    Percent, // %
    At, // @
    LShift, // <<
    RShift, // >>
    Amp, // &
    Pipe, // |
    Caret, // ^
    Tilde, // ~
    Lt, // <
    Gt, // >
    Le, // <=
    Ge, // >=
    EqEq, // ==
    NotEq, // !=
    ColonEqual, // := (named expression)
    Arrow, // ->

    PlusEqual, // +=
    MinusEqual, // -=
    StarEqual, // *=
    StarStarEqual, // **=
    SlashEqual, // /=
    SlashSlashEqual, // //=
    PercentEqual, // %=
    AtEqual, // @=
    AmpEqual, // &=
    PipeEqual, // |=
    CaretEqual, // ^=
    LShiftEqual, // <<=
    RShiftEqual, // >>=

    LParen, // (
    RParen, // )
    LBracket, // [
    RBracket, // ]
    LBrace, // {
    RBrace, // }
    Comma, // ,
    Colon, // :
    Semicolon, // ;
    Dot, // .
    Ellipsis, // ...
    Equal // =
};

// Convert TokenKind to a stable string for diagnostics/logging
const char* to_string(TokenKind k);

// True for +=, -=, ... (augmented assignment operators)
bool isAugAssign(TokenKind k);

} // namespace pyrite::lex
