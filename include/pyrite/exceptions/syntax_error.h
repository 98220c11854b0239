/***
 * Name: pyrite::exceptions::SyntaxError
 * Purpose: Exception raised by parseSourceOrThrow when lexing or parsing failed.
 * Inputs: Rendered error text and the number of underlying errors
 * Outputs: Exception object
 * Theory of Operation: Carries the already formatted diagnostics; the structured
 *   error list stays available through the non-throwing API.
 */
#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include "pyrite/exceptions/pyrite_exception.h"

namespace pyrite {
namespace exceptions {

class SyntaxError : public PyriteException {
 public:
  SyntaxError(std::string msg, size_t errorCount) noexcept
      : PyriteException(std::move(msg)), errorCount_(errorCount) {}

  size_t errorCount() const noexcept { return errorCount_; }

 private:
  size_t errorCount_{0};
};

}  // namespace exceptions
}  // namespace pyrite
