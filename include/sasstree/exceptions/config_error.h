/***
 * Name: sasstree::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
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

class ConfigError : public SasstreeException {
 public:
  explicit ConfigError(std::string msg) noexcept : SasstreeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace sasstree
