#include "cli/ParseArgs.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include "sasstree/exceptions/config_error.h"
#include <iostream>

namespace sasstree::cli {
    /***
     * Name: sasstree::cli::ParseArgs
     * Purpose: Command-line parser for sasstree.
     * Theory of Operation: Helpers throw exceptions::ConfigError for invalid
     *   values; the message is reported here and parsing fails.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        try {
            for (int i = 1; i < argc; ++i) {
                // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                const std::string_view arg{argv[i]};
                if (detail::isFlag(arg, "--")) {
                    detail::collectRemainingAsInputs(static_cast<std::size_t>(i) + 1, argc, argv, out);
                    break;
                }
                if (detail::handleLoadPathFlag(i, argc, argv, out)) { continue; }
                if (detail::applySimpleBoolFlags(arg, out)) { continue; }
                if (detail::applyPrefixedOptions(arg, out)) { continue; }

                // Positional
                if (detail::isUnknownOptionArg(arg)) {
                    std::cerr << "sasstree: unknown option '" << arg << "'\n";
                    return false;
                }
                out.inputs.emplace_back(std::string(arg));
            }
        } catch (const exceptions::ConfigError &e) {
            std::cerr << "sasstree: " << e.what() << "\n";
            return false;
        }

        if (!out.showHelp && out.inputs.empty()) {
            std::cerr << "sasstree: no input files provided\n";
            return false;
        }
        return true;
    }
} // namespace sasstree::cli
