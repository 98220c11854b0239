/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <vector>
#include "ast/Fwd.h"
#include "ast/WithItem.h"

namespace pyrite::ast {

    struct WithStmt {
        std::vector<WithItem> items;
        StmtList body;
        bool isAsync{false};
    };

} // namespace pyrite::ast
