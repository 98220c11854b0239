/**
 * @file
 * @brief AST if statement; elif chains nest in orelse.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    struct IfStmt {
        ExprPtr test;
        StmtList body;
        StmtList orelse; // a single IfStmt for elif
    };

} // namespace pyrite::ast
