/***
 * Name: sasstree::parse::Parser
 * Purpose: Parse an indented stylesheet into a validated AST.
 * Inputs:
 *   - Source text, a file path, or any lex::InputSource
 *   - config::Options (load paths, filename, starting line, ...)
 *   - Expression and import collaborators (defaults provided)
 * Outputs:
 *   - ast::Root annotated with the options.
 * Theory of Operation:
 *   Tokenizer -> StructureLines -> AppendChildren at the root. The first
 *   violation throws exceptions::SyntaxError carrying the source line; the
 *   filename and starting line are attached on the way out. The parser keeps
 *   no per-parse state, so one instance may serve several threads.
 */
#pragma once

#include <memory>
#include <string>
#include "ast/Root.h"
#include "lexer/InputSource.h"
#include "sasstree/config/options.h"
#include "sasstree/support/import_resolver.h"
#include "script/ExpressionParser.h"

namespace sasstree::obs { class Metrics; }

namespace sasstree::parse {

class Parser {
 public:
  explicit Parser(config::Options options = {});
  Parser(config::Options options, std::shared_ptr<const script::ExpressionParser> expressions,
         std::shared_ptr<const support::ImportResolver> imports);

  std::unique_ptr<ast::Root> parseDocument(const std::string& text, obs::Metrics* metrics = nullptr) const;

  /*** parseFile: Read and parse path; the filename option defaults to path. */
  std::unique_ptr<ast::Root> parseFile(const std::string& path, obs::Metrics* metrics = nullptr) const;

  std::unique_ptr<ast::Root> parse(lex::InputSource& input, obs::Metrics* metrics = nullptr) const;

  const config::Options& options() const { return options_; }

 private:
  config::Options options_;
  std::shared_ptr<const script::ExpressionParser> expressions_;
  std::shared_ptr<const support::ImportResolver> imports_;
};

} // namespace sasstree::parse
