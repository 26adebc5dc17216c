#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace sasstree::cli {

namespace {
// Keep help text as a compile-time constant to avoid reallocation work.
constexpr std::string_view kUsageText = R"(sasstree [options] file...

Parse indented stylesheets and print their syntax trees.

Options:
  -h, --help           Print this help and exit
  -I <dir>             Add <dir> to the import load path
  --load-path=<dir>    Same as -I <dir>
  --style=<mode>       Output style: nested|expanded|compact|compressed
  --line=<N>           Number of the first line of each input (default: 1)
  --no-ast             Parse only; do not print the tree
  --metrics            Print parse metrics summary
  --metrics-json       Print parse metrics in JSON
  --log-path=<dir>     Directory where logs are written (lexer/ast)
  --log-lexer          Write the logical line log (requires --log-path)
  --log-ast            Write the AST dump log (requires --log-path)
  --color=<mode>       Color diagnostics: always|never|auto (default: auto)
  --                   End of options
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace sasstree::cli
