/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <string>
#include <vector>
#include "ast/Alias.h"

namespace pyrite::ast {

    // from ..module import names
    struct ImportFrom {
        std::string module{}; // empty for "from . import x"
        std::vector<Alias> names;
        int level{0}; // leading dots
    };

} // namespace pyrite::ast
