/***
 * Name: sasstree::config (options)
 * Purpose: Output style names and import search path assembly.
 */
#include "sasstree/config/options.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sasstree::config {

const char* to_string(const OutputStyle style) {
  switch (style) {
    case OutputStyle::Nested: return "nested";
    case OutputStyle::Expanded: return "expanded";
    case OutputStyle::Compact: return "compact";
    case OutputStyle::Compressed: return "compressed";
  }
  return "nested";
}

bool ParseOutputStyle(const std::string_view text, OutputStyle& out) {
  if (text == "nested") { out = OutputStyle::Nested; return true; }
  if (text == "expanded") { out = OutputStyle::Expanded; return true; }
  if (text == "compact") { out = OutputStyle::Compact; return true; }
  if (text == "compressed") { out = OutputStyle::Compressed; return true; }
  return false;
}

std::vector<std::string> ImportPaths(const Options& options) {
  std::vector<std::string> paths;
  if (options.filename) {
    const auto dir = std::filesystem::path(*options.filename).parent_path();
    paths.push_back(dir.empty() ? std::string(".") : dir.string());
  }
  paths.insert(paths.end(), options.loadPaths.begin(), options.loadPaths.end());
  return paths;
}

} // namespace sasstree::config
