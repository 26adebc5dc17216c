/***
 * Name: sasstree::exceptions::SasstreeException
 * Purpose: Base class for all sasstree exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in sasstree must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace sasstree {
namespace exceptions {

class SasstreeException : public std::exception {
 public:
  virtual ~SasstreeException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit SasstreeException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace sasstree
