/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    struct AssertStmt {
        ExprPtr test;
        ExprPtr msg{}; // optional
    };

} // namespace pyrite::ast
