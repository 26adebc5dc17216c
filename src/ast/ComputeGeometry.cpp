/**
 * @file
 * @brief AST geometry computation implementation.
 */
/***
 * Name: sasstree::ast::ComputeGeometry
 * Purpose: Traverse AST and compute node count and max depth.
 */
#include "ast/GeometrySummary.h"
#include "ast/GeometryVisitor.h"

namespace sasstree::ast {

GeometrySummary ComputeGeometry(const Node& root) {
  GeometryVisitor visitor;
  root.accept(visitor);
  return GeometrySummary{visitor.nodes, visitor.maxDepth};
}

} // namespace sasstree::ast
