/***
 * Name: sasstree::exceptions::ImportError
 * Purpose: Exception for import targets that cannot be resolved.
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

class ImportError : public SasstreeException {
 public:
  explicit ImportError(std::string msg) noexcept : SasstreeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace sasstree
