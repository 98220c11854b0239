/**
 * @file
 * @brief AST unary operator enumeration.
 */
#pragma once

namespace pyrite::ast {

    enum class UnaryOperator {
        Neg,
        Pos,
        Not,
        BitNot
    };

    const char* to_string(UnaryOperator op);

} // namespace pyrite::ast
