/**
 * @file
 * @brief CSS rule node. A rule whose last selector ends in a comma is
 * "continued" and gets merged with the rule on the following line.
 */
#pragma once

#include <string>
#include <utility>
#include <vector>
#include "ast/Node.h"

namespace sasstree::ast {
    struct RuleNode final : Node {
        std::vector<std::string> rules;
        explicit RuleNode(std::string rule) : Node(NodeKind::Rule) { rules.push_back(std::move(rule)); }

        bool continued() const { return !rules.back().empty() && rules.back().back() == ','; }
        void addRules(const RuleNode& other) { rules.insert(rules.end(), other.rules.begin(), other.rules.end()); }
    };
} // namespace sasstree::ast
