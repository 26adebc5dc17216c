/***
 * Name: sasstree::support::ImportResolver
 * Purpose: Locate the file an `@import` entry refers to.
 * Inputs: Import name as written and the ordered search directories
 * Outputs: Resolved path
 * Theory of Operation: Abstract so that tests and embedders can supply their
 *   own lookup. FileImportResolver searches the filesystem: a `.css` name is
 *   returned as is; otherwise `_name.sass` then `name.sass` are probed in each
 *   directory, falling back to `name.css` unless the name explicitly ended in
 *   `.sass`. Failures throw exceptions::ImportError.
 */
#pragma once

#include <string>
#include <vector>

namespace sasstree {
namespace support {

class ImportResolver {
 public:
  virtual ~ImportResolver() = default;

  virtual std::string resolve(const std::string& name, const std::vector<std::string>& searchDirs) const = 0;
};

class FileImportResolver final : public ImportResolver {
 public:
  std::string resolve(const std::string& name, const std::vector<std::string>& searchDirs) const override;
};

}  // namespace support
}  // namespace sasstree
