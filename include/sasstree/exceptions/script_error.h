/***
 * Name: sasstree::exceptions::ScriptError
 * Purpose: Exception for expression parsing failures raised by the expression collaborator.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from SasstreeException.
 */
#pragma once

#include <string>
#include <utility>

#include "sasstree/exceptions/sasstree_exception.h"

namespace sasstree {
namespace exceptions {

class ScriptError : public SasstreeException {
 public:
  explicit ScriptError(std::string msg) noexcept : SasstreeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace sasstree
