#pragma once

#include <memory>
#include <string>
#include <utility>
#include "ast/Node.h"
#include "script/Expression.h"

namespace sasstree::ast {
    struct ForNode final : Node {
        std::string var; // without the leading `!`
        std::unique_ptr<script::Expression> from;
        std::unique_ptr<script::Expression> to;
        bool inclusive{false}; // `through` rather than `to`
        ForNode(std::string v, std::unique_ptr<script::Expression> f, std::unique_ptr<script::Expression> t, const bool incl)
            : Node(NodeKind::For), var(std::move(v)), from(std::move(f)), to(std::move(t)), inclusive(incl) {}
    };
} // namespace sasstree::ast
