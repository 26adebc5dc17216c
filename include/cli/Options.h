#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ColorMode.h"
#include "sasstree/config/options.h"

namespace sasstree::cli {

    struct Options {
        bool showHelp{false};
        bool printAst{true};          // --no-ast clears
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        std::vector<std::string> inputs{};
        std::vector<std::string> loadPaths{}; // -I <dir>, --load-path=<dir>
        config::OutputStyle style{config::OutputStyle::Nested};
        std::optional<int> line{};    // --line=<N>
        ColorMode color{ColorMode::Auto};
        std::string logPath{"."};     // --log-path=<dir> (defaults to ./)
        bool logLexer{false};         // --log-lexer
        bool logAst{false};           // --log-ast (file logging; not to stdout)
    };

    /*** ToParserOptions: Parser configuration for one input file. */
    config::Options ToParserOptions(const Options& opts, const std::string& input);

} // namespace sasstree::cli
