/**
 * @file
 * @brief AST call expression and keyword arguments.
 */
#pragma once

#include <string>
#include <vector>
#include "ast/Fwd.h"
#include "ast/Span.h"

namespace pyrite::ast {

    struct Keyword {
        std::string name; // empty for **mapping
        ExprPtr value;
        Span span{};
    };

    struct Call {
        ExprPtr func;
        ExprList args; // may contain Starred
        std::vector<Keyword> keywords;
    };

} // namespace pyrite::ast
