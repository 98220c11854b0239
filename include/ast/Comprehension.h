/**
 * @file
 * @brief AST comprehension declarations (list, set, dict and generator forms).
 */
#pragma once

#include <vector>
#include "ast/Fwd.h"

namespace pyrite::ast {

    struct ComprehensionFor {
        ExprPtr target;
        ExprPtr iter;
        ExprList ifs; // zero or more if guards
        bool isAsync{false};
    };

    enum class ComprehensionKind { List, Set, Dict, Generator };

    struct Comprehension {
        ComprehensionKind kind{ComprehensionKind::List};
        ExprPtr elt; // key for Dict
        ExprPtr value; // Dict only
        std::vector<ComprehensionFor> generators;
    };

    const char* to_string(ComprehensionKind kind);

} // namespace pyrite::ast
