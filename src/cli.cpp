// ============================================================================
// cli.cpp - Command-line interface and main driver
// ============================================================================

#include "bunit/cli.hpp"
#include "bunit/reporter.hpp"
#include "bunit/runner.hpp"

#include <iostream>
#include <string>

namespace bunit {

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(const std::vector<std::string>& args) {
    Options opts;

    for (const auto& arg : args) {
        if (arg == "-v" || arg == "--verbose") {
            opts.verbosity = Verbosity::Verbose;
        } else if (arg == "-s" || arg == "--summary") {
            opts.verbosity = Verbosity::Summary;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.verbosity = Verbosity::Quiet;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
            break;
        }
        // Anything else is ignored.
    }

    return opts;
}

Options parse_args(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    Options opts = parse_args(args);
    if (argc > 0 && argv[0] != nullptr && argv[0][0] != '\0') {
        opts.program = argv[0];
    }
    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(std::ostream& out, std::string_view program_name) {
    out << "Usage: " << program_name << " [options...]\n"
        << "\n"
        << "Options:\n"
        << "  -v, --verbose  Print expected and provided values\n"
        << "  -s, --summary  Only print summary omitting individual test results\n"
        << "  -q, --quiet    Do not print anything to standard output\n"
        << "  -h, --help     Show usage screen\n";
}

// ── run ─────────────────────────────────────────────────────────────────────

int run(const Options& opts, const std::vector<TestCase>& cases,
        std::ostream& out, std::ostream& err, ColorMode color) {
    // An empty program is a usage condition, not a failure.
    if (opts.help || cases.empty()) {
        print_usage(out, opts.program);
        return 0;
    }

    RunState state;
    state.verbosity = opts.verbosity;

    Reporter reporter(state, out, color);
    return run_tests(cases, state, reporter, err);
}

// ── run_main ────────────────────────────────────────────────────────────────

int run_main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);
    return run(opts, discover(), std::cout, std::cerr);
}

}  // namespace bunit
