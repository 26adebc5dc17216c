/**
 * @file
 * @brief Language-level import, resolved but not yet parsed. The caller
 * parses the file when it evaluates the tree.
 */
#pragma once

#include <string>
#include <utility>
#include "ast/Node.h"

namespace sasstree::ast {
    struct FileNode final : Node {
        std::string filename;
        explicit FileNode(std::string f) : Node(NodeKind::File), filename(std::move(f)) {}
    };
} // namespace sasstree::ast
