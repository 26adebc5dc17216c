#pragma once

namespace sasstree::ast {
    enum class NodeKind {
        Root,
        Rule,
        Attribute,
        Comment,
        Directive,
        Variable,
        MixinDef,
        Mixin,
        If,
        While,
        For,
        Debug,
        File,
        CssImport
    };

    inline const char *to_string(const NodeKind element) {
        switch (element) {
            case NodeKind::Root: return "Root";
            case NodeKind::Rule: return "Rule";
            case NodeKind::Attribute: return "Attribute";
            case NodeKind::Comment: return "Comment";
            case NodeKind::Directive: return "Directive";
            case NodeKind::Variable: return "Variable";
            case NodeKind::MixinDef: return "MixinDef";
            case NodeKind::Mixin: return "Mixin";
            case NodeKind::If: return "If";
            case NodeKind::While: return "While";
            case NodeKind::For: return "For";
            case NodeKind::Debug: return "Debug";
            case NodeKind::File: return "File";
            case NodeKind::CssImport: return "CssImport";
        }
        return "unknown";
    }
} // namespace sasstree::ast
