#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/HasName.h"
#include <utility>
#include "ast/Node.h"
#include "script/Expression.h"

namespace sasstree::ast {
    struct MixinArg {
        std::string name;                                   // without the leading `!`
        std::unique_ptr<script::Expression> defaultValue{}; // optional
    };

    struct MixinDefNode final : Node, HasName {
        std::vector<MixinArg> args;
        MixinDefNode(std::string n, std::vector<MixinArg> a)
            : Node(NodeKind::MixinDef), HasName{std::move(n)}, args(std::move(a)) {}
    };
} // namespace sasstree::ast
