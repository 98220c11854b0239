/***
 * Name: pyrite::exceptions::PyriteException
 * Purpose: Base class for all pyrite exceptions thrown at tool boundaries.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites.
 *   The lexer and parser never throw; they report errors as data. Exceptions are
 *   reserved for callers that want a throwing convenience API.
 */
#pragma once

#include <exception>
#include <string>

namespace pyrite {
namespace exceptions {

class PyriteException : public std::exception {
 public:
  ~PyriteException() noexcept override = default;
  const char* what() const noexcept override;

 protected:
  explicit PyriteException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pyrite
