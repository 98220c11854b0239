/***
 * Name: pyrite::exceptions::PyriteException::PyriteException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "pyrite/exceptions/pyrite_exception.h"

#include <string>
#include <utility>

namespace pyrite {
namespace exceptions {

PyriteException::PyriteException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pyrite
