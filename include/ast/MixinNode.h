#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/HasName.h"
#include <utility>
#include "ast/Node.h"
#include "script/Expression.h"

namespace sasstree::ast {
    struct MixinNode final : Node, HasName {
        std::vector<std::unique_ptr<script::Expression>> args;
        MixinNode(std::string n, std::vector<std::unique_ptr<script::Expression>> a)
            : Node(NodeKind::Mixin), HasName{std::move(n)}, args(std::move(a)) {}
    };
} // namespace sasstree::ast
