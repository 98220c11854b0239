/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <vector>
#include "ast/BinaryOperator.h"
#include "ast/Fwd.h"

namespace pyrite::ast {

    // a < b <= c: left=a, ops=[<, <=], comparators=[b, c]
    struct Compare {
        ExprPtr left;
        std::vector<BinaryOperator> ops;
        ExprList comparators; // length equals ops.size()
    };

} // namespace pyrite::ast
