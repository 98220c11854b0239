/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    struct ReturnStmt {
        ExprPtr value; // optional
    };

} // namespace pyrite::ast
