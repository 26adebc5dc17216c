/**
 * @file
 * @brief AST geometry visitor implementation.
 */
/***
 * Name: sasstree::ast::GeometryVisitor
 * Purpose: AST visitor computing node count and max depth.
 * Theory of Operation: Children count one level deeper than their parent;
 *   an @else branch counts at the same depth as the @if it hangs off.
 */
#include "ast/GeometryVisitor.h"

#include "ast/Nodes.h"

#include <algorithm>

namespace sasstree::ast {
    void GeometryVisitor::bump() {
        ++nodes;
        maxDepth = std::max(maxDepth, depth);
    }

    void GeometryVisitor::descend(const Node &node) {
        for (const auto &child: node.children) {
            const DepthScope scope{depth};
            child->accept(*this);
        }
    }

    GeometryVisitor::DepthScope::DepthScope(uint64_t &ref) : d(ref) { ++d; }
    GeometryVisitor::DepthScope::~DepthScope() { --d; }

    void GeometryVisitor::visit(const Root &root) { bump(); descend(root); }
    void GeometryVisitor::visit(const RuleNode &rule) { bump(); descend(rule); }
    void GeometryVisitor::visit(const AttributeNode &attr) { bump(); descend(attr); }
    void GeometryVisitor::visit(const CommentNode &) { bump(); }
    void GeometryVisitor::visit(const DirectiveNode &directive) { bump(); descend(directive); }
    void GeometryVisitor::visit(const VariableNode &) { bump(); }
    void GeometryVisitor::visit(const MixinDefNode &def) { bump(); descend(def); }
    void GeometryVisitor::visit(const MixinNode &) { bump(); }

    void GeometryVisitor::visit(const IfNode &iff) {
        bump();
        descend(iff);
        if (iff.elseNode) { iff.elseNode->accept(*this); }
    }

    void GeometryVisitor::visit(const WhileNode &loop) { bump(); descend(loop); }
    void GeometryVisitor::visit(const ForNode &loop) { bump(); descend(loop); }
    void GeometryVisitor::visit(const DebugNode &) { bump(); }
    void GeometryVisitor::visit(const FileNode &) { bump(); }
    void GeometryVisitor::visit(const CssImportNode &import) { bump(); descend(import); }
} // namespace sasstree::ast
