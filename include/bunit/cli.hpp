// ============================================================================
// bunit/cli.hpp - Command-line interface handling
// ============================================================================
//
// Parses argv into an Options object and provides the driver used by every
// test program: parse -> help -> discover -> run -> exit code.
//
// ============================================================================

#ifndef BUNIT_CLI_HPP
#define BUNIT_CLI_HPP

#include "bunit/registry.hpp"
#include "bunit/run_state.hpp"
#include "bunit/terminal.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace bunit {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string program   = "<testprogram>";  // argv[0] when available
    Verbosity   verbosity = Verbosity::Normal;
    bool        help      = false;
};

/// Parse command-line arguments.  Never throws: unknown tokens are
/// ignored, the last verbosity flag wins, and parsing stops at -h/--help.
Options parse_args(int argc, char* argv[]);

/// Same, over the arguments after the program name.
Options parse_args(const std::vector<std::string>& args);

/// Print usage information to `out`.
void print_usage(std::ostream& out, std::string_view program_name);

/// Driver over explicit inputs.  Prints usage and returns 0 for --help or
/// when `cases` is empty; otherwise runs them and returns the exit code.
int run(const Options& opts, const std::vector<TestCase>& cases,
        std::ostream& out, std::ostream& err,
        ColorMode color = ColorMode::Auto);

/// Driver over argv and the process-wide registry, writing to
/// std::cout / std::cerr.  The return value is the process exit code.
int run_main(int argc, char* argv[]);

}  // namespace bunit

#endif  // BUNIT_CLI_HPP
