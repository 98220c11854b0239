/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <vector>
#include "ast/ExceptHandler.h"
#include "ast/Fwd.h"

namespace pyrite::ast {

    struct TryStmt {
        StmtList body;
        std::vector<ExceptHandler> handlers;
        StmtList orelse;
        StmtList finalbody;
    };

} // namespace pyrite::ast
