/**
 * @file
 * @brief AST base Node default accept implementation.
 */
/***
 * Name: sasstree::ast::Node::accept
 * Purpose: Dynamic dispatch via the central switch over NodeKind.
 */
#include "ast/Node.h"
#include "ast/Visitor.h"
#include "ast/VisitorBase.h"

namespace sasstree::ast {

void Node::accept(VisitorBase& visitor) const {
    dispatch(*this, visitor);
}

} // namespace sasstree::ast
