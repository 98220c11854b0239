/***
 * Name: pyrite::exceptions::PyriteException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "pyrite/exceptions/pyrite_exception.h"

namespace pyrite::exceptions {

const char* PyriteException::what() const noexcept { return message_.c_str(); }

}  // namespace pyrite::exceptions
