#pragma once

#include <memory>
#include <string>
#include "ast/HasName.h"
#include <utility>
#include "ast/Node.h"
#include "script/Expression.h"

namespace sasstree::ast {
    enum class AttributeStyle {
        Old, // :name value
        New  // name: value
    };

    struct AttributeNode final : Node, HasName {
        std::string value;                        // literal text when expr is null
        std::unique_ptr<script::Expression> expr; // set for `=` values
        AttributeStyle style{AttributeStyle::Old};
        AttributeNode(std::string n, std::string v, const AttributeStyle s)
            : Node(NodeKind::Attribute), HasName{std::move(n)}, value(std::move(v)), style(s) {}
        AttributeNode(std::string n, std::unique_ptr<script::Expression> e, const AttributeStyle s)
            : Node(NodeKind::Attribute), HasName{std::move(n)}, expr(std::move(e)), style(s) {}
    };
} // namespace sasstree::ast
