#pragma once

#include <memory>
#include <string>
#include "ast/HasName.h"
#include <utility>
#include "ast/Node.h"
#include "script/Expression.h"

namespace sasstree::ast {
    struct VariableNode final : Node, HasName {
        std::unique_ptr<script::Expression> expr;
        bool guarded{false}; // `||=`: assign only when unset
        VariableNode(std::string n, std::unique_ptr<script::Expression> e, const bool g)
            : Node(NodeKind::Variable), HasName{std::move(n)}, expr(std::move(e)), guarded(g) {}
    };
} // namespace sasstree::ast
