#ifndef SASSTREE_DRIVER_DRIVER_H
#define SASSTREE_DRIVER_DRIVER_H

/***
 * Name: sasstree::driver::Driver
 * Purpose: Orchestrate the command-line pipeline.
 * Inputs:
 *   - CLI options
 * Outputs:
 *   - AST dumps on stdout, diagnostics on stderr, optional log files; exit code
 * Theory of Operation:
 *   Parses each input file with its own Parser, prints the tree, writes the
 *   optional lexer/AST logs and reports metrics. A file that fails to parse
 *   is reported and the remaining files are still processed.
 */

// Forward declarations to reduce header coupling
namespace sasstree { namespace cli { struct Options; } }
namespace sasstree { namespace driver { struct Diagnostic; } }

namespace sasstree::driver {
    class Driver {
    public:
        static int run(const cli::Options &opts);

        static bool use_env_color();

        static void print_error(const Diagnostic &diag, bool color);
    };
} // namespace sasstree::driver

#endif // SASSTREE_DRIVER_DRIVER_H
