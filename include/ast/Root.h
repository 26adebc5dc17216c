/**
 * @file
 * @brief Document root; carries the options the document was parsed with.
 */
#pragma once

#include "ast/Node.h"
#include "sasstree/config/options.h"

namespace sasstree::ast {
    struct Root final : Node {
        config::Options options{};
        Root() : Node(NodeKind::Root) {}
    };
} // namespace sasstree::ast
