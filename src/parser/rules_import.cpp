/***
 * Name: sasstree::parse::rules::ImportDirective
 * Purpose: `@import a, b` -> one node per entry; `@import url(...)` or a
 *   quoted value is plain CSS and kept verbatim.
 * Theory of Operation: Entries are resolved independently against the
 *   importing file's directory and the load paths. A resolved `.css` path is
 *   emitted as a CSS import, anything else as a FileNode for later loading.
 */
#include "parser/Rules.h"

#include <utility>

#include "ast/CssImportNode.h"
#include "ast/FileNode.h"
#include "sasstree/exceptions/import_error.h"
#include "sasstree/exceptions/syntax_error.h"
#include "sasstree/support/parse_util.h"
#include "sasstree/support/text.h"

namespace sasstree::parse::rules {

namespace {

bool isCssImport(const std::string& value) {
  return value.rfind("url(", 0) == 0 || value.front() == '"';
}

std::vector<std::string> importNames(const std::string& value) {
  std::vector<std::string> names = support::SplitList(value, ',', true);
  for (auto& name : names) {
    std::string_view view(name);
    support::TrimLeadingSpaces(view);
    name = std::string(view);
  }
  while (!names.empty() && names.back().empty()) { names.pop_back(); }
  return names;
}

} // namespace

ClassifyResult ImportDirective(const LineInput& in, const DirectiveParts& parts) {
  if (parts.value && isCssImport(*parts.value)) {
    return ClassifyResult::Produced(std::make_unique<ast::CssImportNode>(in.line.text));
  }
  if (!in.line.children.empty()) {
    throw exceptions::SyntaxError("Illegal nesting: Nothing may be nested beneath import directives.",
                                  in.line.children.front().index);
  }
  if (!parts.value) {
    throw exceptions::SyntaxError("Invalid import directive '@import': expected file name.", in.line.index);
  }

  const std::vector<std::string> searchDirs = config::ImportPaths(in.ctx.options);
  std::vector<std::unique_ptr<ast::Node>> nodes;
  for (const auto& name : importNames(*parts.value)) {
    std::string path;
    try {
      path = in.ctx.imports.resolve(name, searchDirs);
    } catch (const exceptions::ImportError& e) {
      throw exceptions::SyntaxError(e.what(), in.line.index);
    }
    if (support::EndsWith(path, ".css")) {
      nodes.push_back(std::make_unique<ast::CssImportNode>("@import url(" + path + ")"));
    } else {
      nodes.push_back(std::make_unique<ast::FileNode>(std::move(path)));
    }
  }
  return ClassifyResult::ProducedMany(std::move(nodes));
}

} // namespace sasstree::parse::rules
