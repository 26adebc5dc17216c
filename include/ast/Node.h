/**
 * @file
 * @brief AST base node declarations.
 */
#pragma once

#include "NodeKind.h"
#include <memory>
#include <string>
#include <vector>

namespace sasstree::ast {

    struct VisitorBase; // fwd

    struct Node {
        NodeKind kind;
        explicit Node(const NodeKind k) : kind(k) {}
        virtual ~Node() = default;
        Node(const Node&) = delete;
        Node& operator=(const Node&) = delete;

        // Polymorphic dispatch entrypoint (central switch in ast/Visitor.h)
        virtual void accept(VisitorBase& v) const;

        // Most recently appended child, or nullptr
        Node* last() const { return children.empty() ? nullptr : children.back().get(); }

        int line{0};
        std::string file{};
        std::vector<std::unique_ptr<Node>> children{};
    };

} // namespace sasstree::ast
