/***
 * Name: sasstree::parse::ClassifyResult
 * Purpose: Factories for the three classification outcomes.
 */
#include "parser/ClassifyResult.h"

#include <utility>

namespace sasstree::parse {

ClassifyResult ClassifyResult::Produced(std::unique_ptr<ast::Node> node) {
  ClassifyResult r(Kind::ProducedNode);
  r.node_ = std::move(node);
  return r;
}

ClassifyResult ClassifyResult::ProducedMany(std::vector<std::unique_ptr<ast::Node>> nodes) {
  ClassifyResult r(Kind::ProducedNodes);
  r.nodes_ = std::move(nodes);
  return r;
}

ClassifyResult ClassifyResult::Nothing() { return ClassifyResult(Kind::NoOp); }

} // namespace sasstree::parse
