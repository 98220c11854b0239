/**
 * @file
 * @brief Umbrella include for the complete AST.
 */
#pragma once

#include "ast/Expr.h"
#include "ast/Module.h"
#include "ast/Pattern.h"
#include "ast/Stmt.h"
