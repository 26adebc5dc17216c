/***
 * Name: sasstree::parse::ClassifyResult
 * Purpose: Outcome of classifying one line.
 * Theory of Operation: Three explicit states. ProducedNode carries one node,
 *   ProducedNodes a list (a multi-entry @import) and NoOp means the line
 *   changed an existing node (@else) and there is nothing to append.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Node.h"

namespace sasstree::parse {

class ClassifyResult {
 public:
  enum class Kind { ProducedNode, ProducedNodes, NoOp };

  static ClassifyResult Produced(std::unique_ptr<ast::Node> node);
  static ClassifyResult ProducedMany(std::vector<std::unique_ptr<ast::Node>> nodes);
  static ClassifyResult Nothing();

  Kind kind() const { return kind_; }
  ast::Node* node() const { return node_.get(); }
  const std::vector<std::unique_ptr<ast::Node>>& nodes() const { return nodes_; }

  std::unique_ptr<ast::Node> takeNode() { return std::move(node_); }
  std::vector<std::unique_ptr<ast::Node>> takeNodes() { return std::move(nodes_); }

 private:
  explicit ClassifyResult(Kind kind) : kind_(kind) {}

  Kind kind_;
  std::unique_ptr<ast::Node> node_{};
  std::vector<std::unique_ptr<ast::Node>> nodes_{};
};

} // namespace sasstree::parse
