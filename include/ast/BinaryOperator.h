/**
 * @file
 * @brief AST binary, comparison and boolean operator enumeration.
 */
#pragma once

namespace pyrite::ast {

    enum class BinaryOperator {
        Add,
        Sub,
        Mul,
        MatMul,
        Div,
        Mod,
        FloorDiv,
        Pow,
        LShift,
        RShift,
        BitAnd,
        BitOr,
        BitXor,
        Eq,
        Ne,
        Lt,
        Le,
        Gt,
        Ge,
        Is,
        IsNot,
        In,
        NotIn,
        And,
        Or
    };

    // Source spelling, e.g. "+", "not in", "and"
    const char* to_string(BinaryOperator op);

} // namespace pyrite::ast
