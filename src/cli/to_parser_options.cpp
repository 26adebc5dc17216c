#include "cli/Options.h"

namespace sasstree::cli {
    /***
     * Name: sasstree::cli::ToParserOptions
     * Purpose: Map command-line options onto the parser configuration.
     * Theory of Operation: -I directories are searched after the default
     *   load path, in the order given.
     */
    config::Options ToParserOptions(const Options &opts, const std::string &input) {
        config::Options parserOpts;
        parserOpts.style = opts.style;
        parserOpts.loadPaths.insert(parserOpts.loadPaths.end(), opts.loadPaths.begin(), opts.loadPaths.end());
        parserOpts.filename = input;
        parserOpts.line = opts.line;
        return parserOpts;
    }
} // namespace sasstree::cli
