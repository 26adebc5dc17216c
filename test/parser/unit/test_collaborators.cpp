/***
 * Name: test_collaborators
 * Purpose: Custom expression and import collaborators are used and their
 *   failures surface as SyntaxError on the current line.
 */
#include <gtest/gtest.h>
#include <mutex>
#include "ast/Nodes.h"
#include "parser/Parser.h"
#include "sasstree/exceptions/import_error.h"
#include "sasstree/exceptions/script_error.h"
#include "sasstree/exceptions/syntax_error.h"

using namespace sasstree;

namespace {

struct TaggedExpression : script::Expression {
  using script::Expression::Expression;
  std::string inspect() const override { return "<" + source + ">"; }
};

class RecordingExpressions : public script::ExpressionParser {
 public:
  std::unique_ptr<script::Expression> parse(const std::string& text, int line, int offset,
                                            const std::string& filename) const override {
    if (text == "boom") { throw exceptions::ScriptError("cannot parse boom"); }
    const std::lock_guard<std::mutex> lock(mu_);
    seen_.push_back(text);
    return std::make_unique<TaggedExpression>(text, line, offset, filename);
  }
  std::vector<std::string> seen() const {
    const std::lock_guard<std::mutex> lock(mu_);
    return seen_;
  }

 private:
  mutable std::mutex mu_;
  mutable std::vector<std::string> seen_;
};

class MapResolver : public support::ImportResolver {
 public:
  std::string resolve(const std::string& name, const std::vector<std::string>& searchDirs) const override {
    lastDirs = searchDirs;
    if (name == "missing") { throw exceptions::ImportError("no " + name); }
    return "/virtual/" + name + ".sass";
  }
  mutable std::vector<std::string> lastDirs;
};

} // namespace

TEST(Collaborators, ExpressionParserReceivesFragments) {
  auto exprs = std::make_shared<RecordingExpressions>();
  const parse::Parser parser({}, exprs, std::make_shared<MapResolver>());
  const auto root = parser.parseDocument("!a = 1\n@if !a\n  w = !a * 2\n");
  EXPECT_EQ(exprs->seen(), (std::vector<std::string>{"1", "!a", "!a * 2"}));
  const auto& var = static_cast<const ast::VariableNode&>(*root->children[0]);
  EXPECT_EQ(var.expr->inspect(), "<1>");
}

TEST(Collaborators, ScriptErrorBecomesSyntaxError) {
  const parse::Parser parser({}, std::make_shared<RecordingExpressions>(), std::make_shared<MapResolver>());
  try {
    (void)parser.parseDocument("a\n  b\n    c = boom\n");
    FAIL() << "expected SyntaxError";
  } catch (const exceptions::SyntaxError& e) {
    EXPECT_EQ(e.message(), "cannot parse boom");
    EXPECT_EQ(e.line(), 3);
  }
}

TEST(Collaborators, ResolverSeesDocumentDirectoryThenLoadPaths) {
  auto resolver = std::make_shared<MapResolver>();
  config::Options opts;
  opts.filename = "styles/site/main.sass";
  opts.loadPaths = {"vendor", "lib"};
  const parse::Parser parser(opts, std::make_shared<RecordingExpressions>(), resolver);
  const auto root = parser.parseDocument("@import base, grid\n");
  ASSERT_EQ(root->children.size(), 2u);
  EXPECT_EQ(static_cast<const ast::FileNode&>(*root->children[0]).filename, "/virtual/base.sass");
  EXPECT_EQ(static_cast<const ast::FileNode&>(*root->children[1]).filename, "/virtual/grid.sass");
  EXPECT_EQ(resolver->lastDirs, (std::vector<std::string>{"styles/site", "vendor", "lib"}));
}

TEST(Collaborators, ImportErrorBecomesSyntaxError) {
  const parse::Parser parser({}, std::make_shared<RecordingExpressions>(), std::make_shared<MapResolver>());
  try {
    (void)parser.parseDocument("a\n@import ok, missing\n");
    FAIL() << "expected SyntaxError";
  } catch (const exceptions::SyntaxError& e) {
    EXPECT_EQ(e.message(), "no missing");
    EXPECT_EQ(e.line(), 2);
  }
}
