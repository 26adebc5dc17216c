/**
 * @file
 * @brief `@if` node and its chain of `@else` / `@else if` branches.
 */
#pragma once

#include <memory>
#include <utility>
#include "ast/Node.h"
#include "script/Expression.h"

namespace sasstree::ast {
    struct IfNode final : Node {
        std::unique_ptr<script::Expression> expr; // null for a bare `@else`
        std::unique_ptr<IfNode> elseNode{};
        explicit IfNode(std::unique_ptr<script::Expression> e) : Node(NodeKind::If), expr(std::move(e)) {}

        // Append to the end of the else chain
        void addElse(std::unique_ptr<IfNode> branch) {
            IfNode* tail = this;
            while (tail->elseNode) { tail = tail->elseNode.get(); }
            tail->elseNode = std::move(branch);
        }
    };
} // namespace sasstree::ast
