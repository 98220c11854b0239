/**
 * @file
 * @brief AST module node: the root of one parsed source buffer.
 */
#pragma once

#include <string>
#include "ast/Fwd.h"
#include "ast/Span.h"
#include "ast/Stmt.h"

namespace pyrite::ast {

    struct Module {
        StmtList body;
        std::string file{};
        Span span{};
    };

} // namespace pyrite::ast
