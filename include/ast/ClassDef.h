/**
 * @file
 * @brief AST class definition.
 */
#pragma once

#include <string>
#include <vector>
#include "ast/Call.h"
#include "ast/Fwd.h"

namespace pyrite::ast {

    struct ClassDef {
        std::string name;
        ExprList bases;
        std::vector<Keyword> keywords; // metaclass=..., **kw
        StmtList body;
        ExprList decorators;
    };

} // namespace pyrite::ast
