#include "cli/ParseArgsInternals.h"

#include "sasstree/exceptions/config_error.h"

namespace sasstree::cli::detail {
    /***
     * Name: sasstree::cli::detail::handleLoadPathFlag
     * Purpose: Handle `-I <dir>` and `-I<dir>`.
     */
    bool handleLoadPathFlag(int &idx, const int argc, char **argv, Options &out) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        const std::string_view arg{argv[idx]};
        if (!arg.starts_with("-I")) { return false; }
        if (arg.size() > 2) {
            out.loadPaths.emplace_back(arg.substr(2));
            return true;
        }
        if (idx + 1 >= argc) {
            throw exceptions::ConfigError("missing directory after '-I'");
        }
        ++idx;
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.loadPaths.emplace_back(argv[idx]);
        return true;
    }
} // namespace sasstree::cli::detail
