#pragma once

#include "ast/NodeKind.h"

namespace sasstree::ast {

// Forward declarations to break include cycles
struct Root; struct RuleNode; struct AttributeNode; struct CommentNode; struct DirectiveNode;
struct VariableNode; struct MixinDefNode; struct MixinNode; struct IfNode; struct WhileNode;
struct ForNode; struct DebugNode; struct FileNode; struct CssImportNode;

// Virtual visitor interface. Every overload is pure so a new node kind fails
// to compile until each visitor handles it.
struct VisitorBase {
  virtual ~VisitorBase() = default;
  virtual void visit(const Root&) = 0;
  virtual void visit(const RuleNode&) = 0;
  virtual void visit(const AttributeNode&) = 0;
  virtual void visit(const CommentNode&) = 0;
  virtual void visit(const DirectiveNode&) = 0;
  virtual void visit(const VariableNode&) = 0;
  virtual void visit(const MixinDefNode&) = 0;
  virtual void visit(const MixinNode&) = 0;
  virtual void visit(const IfNode&) = 0;
  virtual void visit(const WhileNode&) = 0;
  virtual void visit(const ForNode&) = 0;
  virtual void visit(const DebugNode&) = 0;
  virtual void visit(const FileNode&) = 0;
  virtual void visit(const CssImportNode&) = 0;
};

} // namespace sasstree::ast
