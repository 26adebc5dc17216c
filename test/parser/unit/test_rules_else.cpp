/***
 * Name: test_rules_else
 * Purpose: @else attaches to the preceding @if and never becomes a sibling.
 */
#include <gtest/gtest.h>
#include "ast/Nodes.h"
#include "parser/Rules.h"
#include "sasstree/exceptions/syntax_error.h"
#include "script/Expression.h"
#include "../../util/RuleHarness.h"

using namespace sasstree;
using testutil::makeLine;
using testutil::withChild;

static ast::IfNode& addIf(ast::Node& parent) {
  auto node = std::make_unique<ast::IfNode>(std::make_unique<script::Expression>("!a", 1, 4, "test.sass"));
  auto& ref = *node;
  parent.children.push_back(std::move(node));
  return ref;
}

TEST(RulesElse, BareElseAppendsBranch) {
  testutil::RuleHarness h;
  auto& iff = addIf(h.parent);
  const auto r = h.run(&parse::rules::Directive, withChild(makeLine("@else", 3), "color: red"));
  EXPECT_EQ(r.kind(), parse::ClassifyResult::Kind::NoOp);
  EXPECT_EQ(h.parent.children.size(), 1u);
  ASSERT_NE(iff.elseNode, nullptr);
  EXPECT_EQ(iff.elseNode->expr, nullptr);
  EXPECT_EQ(iff.elseNode->line, 3);
  EXPECT_EQ(iff.elseNode->file, "test.sass");
  ASSERT_EQ(iff.elseNode->children.size(), 1u);
  EXPECT_EQ(iff.elseNode->children[0]->kind, ast::NodeKind::Attribute);
  EXPECT_EQ(iff.elseNode->children[0]->line, 4);
}

TEST(RulesElse, ElseIfChainsInOrder) {
  testutil::RuleHarness h;
  auto& iff = addIf(h.parent);
  (void)h.run(&parse::rules::Directive, makeLine("@else if !b", 2));
  (void)h.run(&parse::rules::Directive, makeLine("@else", 3));
  ASSERT_NE(iff.elseNode, nullptr);
  ASSERT_NE(iff.elseNode->expr, nullptr);
  EXPECT_EQ(iff.elseNode->expr->source, "!b");
  EXPECT_EQ(iff.elseNode->expr->offset, 9);
  ASSERT_NE(iff.elseNode->elseNode, nullptr);
  EXPECT_EQ(iff.elseNode->elseNode->expr, nullptr);
  EXPECT_EQ(iff.elseNode->elseNode->line, 3);
}

TEST(RulesElse, RequiresPrecedingIf) {
  testutil::RuleHarness h;
  EXPECT_THROW((void)h.run(&parse::rules::Directive, makeLine("@else")), exceptions::SyntaxError);
  h.parent.children.push_back(std::make_unique<ast::RuleNode>("a"));
  try {
    (void)h.run(&parse::rules::Directive, makeLine("@else", 7));
    FAIL() << "expected SyntaxError";
  } catch (const exceptions::SyntaxError& e) {
    EXPECT_EQ(e.message(), "@else must come after @if.");
    EXPECT_EQ(e.line(), 7);
  }
}

TEST(RulesElse, GuardMustBeIf) {
  testutil::RuleHarness h;
  addIf(h.parent);
  try {
    (void)h.run(&parse::rules::Directive, makeLine("@else when !x"));
    FAIL() << "expected SyntaxError";
  } catch (const exceptions::SyntaxError& e) {
    EXPECT_EQ(e.message(), "Invalid else directive '@else when !x': expected 'if <expr>'.");
  }
}

TEST(RulesElse, BranchChildrenAreNotRoot) {
  testutil::RuleHarness h;
  addIf(h.parent);
  try {
    (void)h.run(&parse::rules::Directive, withChild(makeLine("@else", 1), "=mixin"));
    FAIL() << "expected SyntaxError";
  } catch (const exceptions::SyntaxError& e) {
    EXPECT_EQ(e.message(), "Mixins may only be defined at the root of a document.");
    EXPECT_EQ(e.line(), 2);
  }
}
