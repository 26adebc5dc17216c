/***
 * Name: sasstree::exceptions::SasstreeException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "sasstree/exceptions/sasstree_exception.h"

namespace sasstree::exceptions {

const char* SasstreeException::what() const noexcept { return message_.c_str(); }

}  // namespace sasstree::exceptions
