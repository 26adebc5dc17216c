#pragma once

#include <string>
#include <utility>
#include "ast/Node.h"

namespace sasstree::ast {
    struct DirectiveNode final : Node {
        std::string value; // verbatim, including the leading `@`
        explicit DirectiveNode(std::string v) : Node(NodeKind::Directive), value(std::move(v)) {}
    };
} // namespace sasstree::ast
