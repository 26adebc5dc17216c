#pragma once

#include <memory>
#include <utility>
#include "ast/Node.h"
#include "script/Expression.h"

namespace sasstree::ast {
    struct WhileNode final : Node {
        std::unique_ptr<script::Expression> expr;
        explicit WhileNode(std::unique_ptr<script::Expression> e) : Node(NodeKind::While), expr(std::move(e)) {}
    };
} // namespace sasstree::ast
