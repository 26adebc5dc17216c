#pragma once

#include <string>
#include <vector>
#include <utility>
#include "ast/Node.h"

namespace sasstree::ast {
    struct CommentNode final : Node {
        std::string text;
        bool silent{false};              // `//` comments are dropped from output
        std::vector<std::string> lines;  // nested lines, verbatim, depth-first
        CommentNode(std::string t, const bool s) : Node(NodeKind::Comment), text(std::move(t)), silent(s) {}
    };
} // namespace sasstree::ast
