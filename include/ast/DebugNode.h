#pragma once

#include <memory>
#include <utility>
#include "ast/Node.h"
#include "script/Expression.h"

namespace sasstree::ast {
    struct DebugNode final : Node {
        std::unique_ptr<script::Expression> expr;
        explicit DebugNode(std::unique_ptr<script::Expression> e) : Node(NodeKind::Debug), expr(std::move(e)) {}
    };
} // namespace sasstree::ast
