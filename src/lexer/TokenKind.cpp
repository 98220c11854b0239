/**
 * Name: pyrite::lex::TokenKind helpers
 * Purpose: Implementation for TokenKind and LexErrorKind utilities.
 */
#include "lexer/TokenKind.h"
#include "lexer/LexError.h"

namespace pyrite::lex {
    const char *to_string(const TokenKind k) {
        using enum pyrite::lex::TokenKind;
        switch (k) {
            case End: return "End";
            case Newline: return "Newline";
            case Indent: return "Indent";
            case Dedent: return "Dedent";
            case Error: return "Error";
            case False: return "False";
            case None: return "None";
            case True: return "True";
            case And: return "And";
            case As: return "As";
            case Assert: return "Assert";
            case Async: return "Async";
            case Await: return "Await";
            case Break: return "Break";
            case Class: return "Class";
            case Continue: return "Continue";
            case Def: return "Def";
            case Del: return "Del";
            case Elif: return "Elif";
            case Else: return "Else";
            case Except: return "Except";
            case Finally: return "Finally";
            case For: return "For";
            case From: return "From";
            case Global: return "Global";
            case If: return "If";
            case Import: return "Import";
            case In: return "In";
            case Is: return "Is";
            case Lambda: return "Lambda";
            case Nonlocal: return "Nonlocal";
            case Not: return "Not";
            case Or: return "Or";
            case Pass: return "Pass";
            case Raise: return "Raise";
            case Return: return "Return";
            case Try: return "Try";
            case While: return "While";
            case With: return "With";
            case Yield: return "Yield";
            case Ident: return "Ident";
            case Int: return "Int";
            case Float: return "Float";
            case Imag: return "Imag";
            case String: return "String";
            case Bytes: return "Bytes";
            case FString: return "FString";
            case Plus: return "Plus";
            case Minus: return "Minus";
            case Star: return "Star";
            case StarStar: return "StarStar";
            case Slash: return "Slash";
            case SlashSlash: return "SlashSlash";
            case Percent: return "Percent";
            case At: return "At";
            case LShift: return "LShift";
            case RShift: return "RShift";
            case Amp: return "Amp";
            case Pipe: return "Pipe";
            case Caret: return "Caret";
            case Tilde: return "Tilde";
            case Lt: return "Lt";
            case Gt: return "Gt";
            case Le: return "Le";
            case Ge: return "Ge";
            case EqEq: return "EqEq";
            case NotEq: return "NotEq";
            case ColonEqual: return "ColonEqual";
            case Arrow: return "Arrow";
            case PlusEqual: return "PlusEqual";
            case MinusEqual: return "MinusEqual";
            case StarEqual: return "StarEqual";
            case StarStarEqual: return "StarStarEqual";
            case SlashEqual: return "SlashEqual";
            case SlashSlashEqual: return "SlashSlashEqual";
            case PercentEqual: return "PercentEqual";
            case AtEqual: return "AtEqual";
            case AmpEqual: return "AmpEqual";
            case PipeEqual: return "PipeEqual";
            case CaretEqual: return "CaretEqual";
            case LShiftEqual: return "LShiftEqual";
            case RShiftEqual: return "RShiftEqual";
            case LParen: return "LParen";
            case RParen: return "RParen";
            case LBracket: return "LBracket";
            case RBracket: return "RBracket";
            case LBrace: return "LBrace";
            case RBrace: return "RBrace";
            case Comma: return "Comma";
            case Colon: return "Colon";
            case Semicolon: return "Semicolon";
            case Dot: return "Dot";
            case Ellipsis: return "Ellipsis";
            case Equal: return "Equal";
        }
        return "Unknown";
    }

    bool isAugAssign(const TokenKind k) {
        using enum pyrite::lex::TokenKind;
        switch (k) {
            case PlusEqual: case MinusEqual: case StarEqual: case StarStarEqual:
            case SlashEqual: case SlashSlashEqual: case PercentEqual: case AtEqual:
            case AmpEqual: case PipeEqual: case CaretEqual: case LShiftEqual: case RShiftEqual:
                return true;
            default:
                return false;
        }
    }

    const char *to_string(const LexErrorKind k) {
        switch (k) {
            case LexErrorKind::InvalidSyntax: return "InvalidSyntax";
            case LexErrorKind::UnterminatedLiteral: return "UnterminatedLiteral";
            case LexErrorKind::InconsistentIndentation: return "InconsistentIndentation";
        }
        return "Unknown";
    }
} // namespace pyrite::lex
