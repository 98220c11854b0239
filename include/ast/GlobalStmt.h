/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <string>
#include <vector>

namespace pyrite::ast {

    struct GlobalStmt {
        std::vector<std::string> names;
    };

} // namespace pyrite::ast
