/***
 * Name: sasstree::exceptions::SasstreeException::SasstreeException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "sasstree/exceptions/sasstree_exception.h"

#include <utility>

namespace sasstree {
namespace exceptions {

SasstreeException::SasstreeException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace sasstree
