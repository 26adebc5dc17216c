/**
 * @file
 * @brief AST geometry visitor declarations.
 */
#pragma once

#include <cstdint>
#include "ast/VisitorBase.h"

namespace sasstree::ast {

struct Node;

// Defined in src/ast/GeometryVisitor.cpp
struct GeometryVisitor final : public VisitorBase {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
  uint64_t depth{0};

  void bump();
  void descend(const Node& node);

  struct DepthScope {
    uint64_t& d;
    explicit DepthScope(uint64_t& ref);
    ~DepthScope();
    DepthScope(const DepthScope&) = delete;
    DepthScope& operator=(const DepthScope&) = delete;
    DepthScope(DepthScope&&) = delete;
    DepthScope& operator=(DepthScope&&) = delete;
  };

  void visit(const Root& root) override;
  void visit(const RuleNode& rule) override;
  void visit(const AttributeNode& attr) override;
  void visit(const CommentNode& comment) override;
  void visit(const DirectiveNode& directive) override;
  void visit(const VariableNode& var) override;
  void visit(const MixinDefNode& def) override;
  void visit(const MixinNode& mixin) override;
  void visit(const IfNode& iff) override;
  void visit(const WhileNode& loop) override;
  void visit(const ForNode& loop) override;
  void visit(const DebugNode& debug) override;
  void visit(const FileNode& file) override;
  void visit(const CssImportNode& import) override;
};

} // namespace sasstree::ast
