#include "cli/ParseArgsInternals.h"

namespace sasstree::cli::detail {

/***
 * Name: sasstree::cli::detail::collectRemainingAsInputs
 * Purpose: Everything after `--` is an input path, even when it starts with '-'.
 */
void collectRemainingAsInputs(const std::size_t startIndex, const int argc, char** argv, Options& out) {
    for (auto j = startIndex; j < static_cast<std::size_t>(argc); ++j) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        const std::string_view path{argv[j]};
        if (!path.empty()) { out.inputs.emplace_back(path); }
    }
}

} // namespace sasstree::cli::detail
