/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <vector>
#include "ast/Alias.h"

namespace pyrite::ast {

    struct Import {
        std::vector<Alias> names;
    };

} // namespace pyrite::ast
