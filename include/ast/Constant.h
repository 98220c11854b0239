/**
 * @file
 * @brief AST literal constant (None, booleans, Ellipsis, numbers, str, bytes).
 */
#pragma once

#include <string>
#include "pyrite/support/big_int.h"

namespace pyrite::ast {

    struct Constant {
        enum class Kind { None, True, False, Ellipsis, Int, Float, Imag, Str, Bytes };
        Kind kind{Kind::None};
        support::BigInt intValue{}; // Int
        double floatValue{0.0}; // Float; imaginary part for Imag
        std::string text{}; // Str (UTF-8) or Bytes (raw bytes)
    };

    const char* to_string(Constant::Kind kind);

} // namespace pyrite::ast
