/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"
#include "ast/UnaryOperator.h"

namespace pyrite::ast {

    struct Unary {
        UnaryOperator op{UnaryOperator::Neg};
        ExprPtr operand;
    };

} // namespace pyrite::ast
