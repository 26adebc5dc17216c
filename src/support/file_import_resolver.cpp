/***
 * Name: sasstree::support::FileImportResolver::resolve
 * Purpose: Resolve a language-level import against the search directories.
 * Inputs:
 *   - name: import target as written (`foo`, `dir/foo`, `foo.sass`, `foo.css`)
 *   - searchDirs: directories probed in order
 * Outputs: Absolute path of the stylesheet, or a `.css` name left for the browser
 * Theory of Operation: Partials (`_foo.sass`) are preferred over `foo.sass`
 *   within a directory; the first directory with a match wins.
 */
#include "sasstree/support/import_resolver.h"

#include "sasstree/exceptions/import_error.h"
#include "sasstree/support/fs.h"
#include "sasstree/support/text.h"

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sasstree::support {

namespace {
constexpr std::string_view kSassExt = ".sass";
constexpr std::string_view kCssExt = ".css";
} // namespace

static std::optional<std::string> findFullPath(const std::string& filename, const std::vector<std::string>& searchDirs) {
  namespace fs = std::filesystem;
  const fs::path relative(filename);
  const fs::path partial = relative.parent_path() / ("_" + relative.filename().string());
  for (const auto& dir : searchDirs) {
    for (const auto& candidate : {partial, relative}) {
      const fs::path full = fs::path(dir) / candidate;
      if (IsReadableFile(full.string())) {
        return fs::absolute(full).lexically_normal().string();
      }
    }
  }
  return std::nullopt;
}

std::string FileImportResolver::resolve(const std::string& name, const std::vector<std::string>& searchDirs) const {
  std::string base = name;
  bool wasSass = false;
  if (EndsWith(name, kSassExt)) {
    base = name.substr(0, name.size() - kSassExt.size());
    wasSass = true;
  } else if (EndsWith(name, kCssExt)) {
    return name;
  }
  if (auto found = findFullPath(base + std::string(kSassExt), searchDirs)) {
    return *found;
  }
  if (!wasSass) {
    return base + std::string(kCssExt);
  }
  throw exceptions::ImportError("File to import not found or unreadable: " + name + ".");
}

}  // namespace sasstree::support
