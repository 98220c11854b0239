/**
 * @file
 * @brief AST declarations.
 */
#pragma once


namespace pyrite::ast {

    struct PassStmt {};

} // namespace pyrite::ast
