/***
 * Name: sasstree::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
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

class FileReadError : public SasstreeException {
 public:
  explicit FileReadError(std::string msg) noexcept : SasstreeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace sasstree
