/**
 * @file
 * @brief AST except clause.
 */
#pragma once

#include <string>
#include "ast/Fwd.h"
#include "ast/Span.h"

namespace pyrite::ast {

    struct ExceptHandler {
        ExprPtr type{}; // null for a bare except
        std::string name{}; // "as" name, may be empty
        StmtList body;
        Span span{};
    };

} // namespace pyrite::ast
