#include "cli/ParseArgsInternals.h"

namespace sasstree::cli::detail {
    /***
     * Name: sasstree::cli::detail::isFlag
     * Purpose: Check if an argument exactly matches a flag.
     */
    bool isFlag(const std::string_view arg, const std::string_view flag) {
        return arg == flag;
    }
} // namespace sasstree::cli::detail
