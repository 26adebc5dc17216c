#pragma once

#include <string>
#include <utility>
#include "ast/Node.h"

namespace sasstree::ast {
    // Plain CSS `@import`, passed through untouched
    struct CssImportNode final : Node {
        std::string value;
        explicit CssImportNode(std::string v) : Node(NodeKind::CssImport), value(std::move(v)) {}
    };
} // namespace sasstree::ast
