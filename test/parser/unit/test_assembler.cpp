/***
 * Name: test_assembler
 * Purpose: Continuation merging, root-only placement, flattening and stamping.
 */
#include <gtest/gtest.h>
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/Assembler.h"
#include "parser/TreeStructurer.h"
#include "sasstree/exceptions/syntax_error.h"
#include "../../util/RuleHarness.h"

using namespace sasstree;

static std::unique_ptr<ast::Root> assemble(testutil::RuleHarness& h, const char* src) {
  auto root = std::make_unique<ast::Root>();
  const auto tree = parse::StructureLines(lex::Tokenizer().tabulate(src, "doc.sass"));
  parse::AppendChildren(h.ctx, *root, tree, true);
  return root;
}

static std::pair<std::string, int> assembleError(const char* src) {
  testutil::RuleHarness h;
  try {
    (void)assemble(h, src);
  } catch (const exceptions::SyntaxError& e) {
    return {e.message(), e.line()};
  }
  return {"<no error>", 0};
}

TEST(Assembler, ContinuedRulesMerge) {
  testutil::RuleHarness h;
  const auto root = assemble(h, "a,\nb,\nc\n  color: red\n");
  ASSERT_EQ(root->children.size(), 1u);
  const auto& rule = static_cast<const ast::RuleNode&>(*root->children[0]);
  EXPECT_EQ(rule.rules, (std::vector<std::string>{"a,", "b,", "c"}));
  EXPECT_EQ(rule.line, 1);
  ASSERT_EQ(rule.children.size(), 1u);
  EXPECT_EQ(rule.children[0]->kind, ast::NodeKind::Attribute);
}

TEST(Assembler, ContinuedRuleErrors) {
  const std::pair<std::string, int> nested{"Rules can't end in commas.", 1};
  EXPECT_EQ(assembleError("a,\n  color: red\nb\n"), nested);
  EXPECT_EQ(assembleError("a,\n!x = 1\n"), nested);
  EXPECT_EQ(assembleError("x\na,\n"), (std::pair<std::string, int>{"Rules can't end in commas.", 2}));
  EXPECT_EQ(assembleError("a,\n@import url(x.css)\n"), nested);
}

TEST(Assembler, RootOnlyPlacement) {
  EXPECT_EQ(assembleError("a\n  =m\n"),
            (std::pair<std::string, int>{"Mixins may only be defined at the root of a document.", 2}));
  EXPECT_EQ(assembleError("a\n  @import url(x.css)\n"),
            (std::pair<std::string, int>{"Import directives may only be used at the root of a document.", 2}));
  EXPECT_EQ(assembleError("a\n  b\n    @import x.css, y.css\n"),
            (std::pair<std::string, int>{"Import directives may only be used at the root of a document.", 3}));
}

TEST(Assembler, NestedDirectivesAllowed) {
  testutil::RuleHarness h;
  const auto root = assemble(h, "a\n  @media print\n    color: black\n  +m\n  !v = 1\n");
  const auto& rule = *root->children[0];
  ASSERT_EQ(rule.children.size(), 3u);
  EXPECT_EQ(rule.children[0]->kind, ast::NodeKind::Directive);
  EXPECT_EQ(rule.children[0]->children.size(), 1u);
  EXPECT_EQ(rule.children[1]->kind, ast::NodeKind::Mixin);
  EXPECT_EQ(rule.children[2]->kind, ast::NodeKind::Variable);
}

TEST(Assembler, MultiImportFlattenedInOrder) {
  testutil::RuleHarness h;
  const auto root = assemble(h, "@import a.css, b.css\nx\n");
  ASSERT_EQ(root->children.size(), 3u);
  EXPECT_EQ(static_cast<const ast::CssImportNode&>(*root->children[0]).value, "@import url(a.css)");
  EXPECT_EQ(static_cast<const ast::CssImportNode&>(*root->children[1]).value, "@import url(b.css)");
  EXPECT_EQ(root->children[0]->line, 1);
  EXPECT_EQ(root->children[1]->file, "doc.sass");
  EXPECT_EQ(root->children[2]->kind, ast::NodeKind::Rule);
}

TEST(Assembler, StampsLineAndFile) {
  testutil::RuleHarness h;
  const auto root = assemble(h, "a\n\n  b\n    c: d\n");
  const auto& b = *root->children[0]->children[0];
  EXPECT_EQ(b.line, 3);
  EXPECT_EQ(b.file, "doc.sass");
  EXPECT_EQ(b.children[0]->line, 4);
}

TEST(Assembler, CommentBodiesAreNotParsed) {
  testutil::RuleHarness h;
  const auto root = assemble(h, "/* header\n  =not a mixin\n  @import nothing\na\n");
  ASSERT_EQ(root->children.size(), 2u);
  const auto& c = static_cast<const ast::CommentNode&>(*root->children[0]);
  EXPECT_TRUE(c.children.empty());
  EXPECT_EQ(c.lines, (std::vector<std::string>{"=not a mixin", "@import nothing"}));
}

TEST(Assembler, IfElseChain) {
  testutil::RuleHarness h;
  const auto root = assemble(h, "@if !a\n  x: 1\n@else if !b\n  x: 2\n@else\n  x: 3\ny\n");
  ASSERT_EQ(root->children.size(), 2u);
  const auto& iff = static_cast<const ast::IfNode&>(*root->children[0]);
  ASSERT_NE(iff.elseNode, nullptr);
  ASSERT_NE(iff.elseNode->elseNode, nullptr);
  EXPECT_EQ(iff.elseNode->elseNode->elseNode, nullptr);
  EXPECT_EQ(iff.elseNode->children.size(), 1u);
  EXPECT_EQ(iff.elseNode->elseNode->children.size(), 1u);
  EXPECT_EQ(root->children[1]->kind, ast::NodeKind::Rule);
}

TEST(Assembler, ElseOutsideIf) {
  EXPECT_EQ(assembleError("a\n  @else\n"), (std::pair<std::string, int>{"@else must come after @if.", 2}));
  EXPECT_EQ(assembleError("@if !a\nb\n@else\n"), (std::pair<std::string, int>{"@else must come after @if.", 3}));
}
