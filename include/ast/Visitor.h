#pragma once

#include "ast/Nodes.h"

namespace sasstree::ast {

template <typename V>
void dispatch(const Node& n, V& v) {
    switch (n.kind) {
        case NodeKind::Root: v.visit(static_cast<const Root&>(n)); break;
        case NodeKind::Rule: v.visit(static_cast<const RuleNode&>(n)); break;
        case NodeKind::Attribute: v.visit(static_cast<const AttributeNode&>(n)); break;
        case NodeKind::Comment: v.visit(static_cast<const CommentNode&>(n)); break;
        case NodeKind::Directive: v.visit(static_cast<const DirectiveNode&>(n)); break;
        case NodeKind::Variable: v.visit(static_cast<const VariableNode&>(n)); break;
        case NodeKind::MixinDef: v.visit(static_cast<const MixinDefNode&>(n)); break;
        case NodeKind::Mixin: v.visit(static_cast<const MixinNode&>(n)); break;
        case NodeKind::If: v.visit(static_cast<const IfNode&>(n)); break;
        case NodeKind::While: v.visit(static_cast<const WhileNode&>(n)); break;
        case NodeKind::For: v.visit(static_cast<const ForNode&>(n)); break;
        case NodeKind::Debug: v.visit(static_cast<const DebugNode&>(n)); break;
        case NodeKind::File: v.visit(static_cast<const FileNode&>(n)); break;
        case NodeKind::CssImport: v.visit(static_cast<const CssImportNode&>(n)); break;
    }
}

} // namespace sasstree::ast
