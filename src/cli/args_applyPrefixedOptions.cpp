#include "cli/ParseArgsInternals.h"

#include <string>

namespace sasstree::cli::detail {
    /***
     * Name: sasstree::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like load-path/style/line/color.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view loadPathPrefix{"--load-path="}; arg.starts_with(loadPathPrefix)) {
            out.loadPaths.emplace_back(arg.substr(loadPathPrefix.size()));
            return true;
        }

        if (constexpr std::string_view stylePrefix{"--style="}; arg.starts_with(stylePrefix)) {
            out.style = parseStyleValue(arg.substr(stylePrefix.size()));
            return true;
        }

        if (constexpr std::string_view linePrefix{"--line="}; arg.starts_with(linePrefix)) {
            out.line = parseLineValue(arg.substr(linePrefix.size()));
            return true;
        }

        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.starts_with(logPathPrefix)) {
            out.logPath = std::string(arg.substr(logPathPrefix.size()));
            return true;
        }

        if (constexpr std::string_view colorPrefix{"--color="}; arg.starts_with(colorPrefix)) {
            out.color = parseColorValue(arg.substr(colorPrefix.size()));
            return true;
        }
        return false;
    }
} // namespace sasstree::cli::detail
