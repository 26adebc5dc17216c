/***
 * Name: sasstree::support::IsReadableFile
 * Purpose: Probe an import candidate without throwing.
 */
#include "sasstree/support/fs.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace sasstree::support {

bool IsReadableFile(const std::string& path) {
  std::error_code errCode;
  if (!std::filesystem::is_regular_file(path, errCode)) { return false; }
  const std::ifstream probe(path);
  return probe.good();
}

}  // namespace sasstree::support
