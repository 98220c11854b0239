/**
 * @file
 * @brief AST declarations.
 */
#pragma once


namespace pyrite::ast {

    struct ContinueStmt {};

} // namespace pyrite::ast
