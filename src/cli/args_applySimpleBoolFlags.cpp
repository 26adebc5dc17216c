#include "cli/ParseArgsInternals.h"

namespace sasstree::cli::detail {
    /***
     * Name: sasstree::cli::detail::applySimpleBoolFlags
     * Purpose: Apply flag-only options; false when arg is not one of them.
     */
    bool applySimpleBoolFlags(const std::string_view arg, Options &out) {
        if (isFlag(arg, "-h") || isFlag(arg, "--help")) { out.showHelp = true; return true; }
        if (isFlag(arg, "--no-ast")) { out.printAst = false; return true; }
        if (isFlag(arg, "--metrics")) { out.metrics = true; return true; }
        if (isFlag(arg, "--metrics-json")) { out.metricsJson = true; return true; }
        if (isFlag(arg, "--log-lexer")) { out.logLexer = true; return true; }
        if (isFlag(arg, "--log-ast")) { out.logAst = true; return true; }
        return false;
    }
} // namespace sasstree::cli::detail
