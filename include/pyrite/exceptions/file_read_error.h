/***
 * Name: pyrite::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures in tools.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyriteException.
 */
#pragma once

#include <string>
#include <utility>

#include "pyrite/exceptions/pyrite_exception.h"

namespace pyrite {
namespace exceptions {

class FileReadError : public PyriteException {
 public:
  explicit FileReadError(std::string msg) noexcept : PyriteException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyrite
