// ============================================================================
// cli_tests.cpp - Flag parsing, usage text and the driver
// ============================================================================

#include "test_support.hpp"

#include <sstream>
#include <string>
#include <vector>

using bunit::Options;
using bunit::TestCase;
using bunit::TestContext;

namespace {

std::string verbosity_of(const std::vector<std::string>& args) {
    return bunit::verbosity_to_string(bunit::parse_args(args).verbosity);
}

const std::string kUsage =
    "Usage: prog [options...]\n"
    "\n"
    "Options:\n"
    "  -v, --verbose  Print expected and provided values\n"
    "  -s, --summary  Only print summary omitting individual test results\n"
    "  -q, --quiet    Do not print anything to standard output\n"
    "  -h, --help     Show usage screen\n";

}  // namespace

// ── parse_args ──────────────────────────────────────────────────────────────

BUNIT_TEST(testParseDefaults) {
    Options opts = bunit::parse_args(std::vector<std::string>{});
    ctx.assert_equal(bunit::verbosity_to_string(opts.verbosity), "normal");
    ctx.assert_return(opts.help, false);
    ctx.assert_equal(opts.program, "<testprogram>");
}

BUNIT_TEST(testParseShortAndLongFlags) {
    ctx.assert_equal(verbosity_of({"-v"}), "verbose");
    ctx.assert_equal(verbosity_of({"--verbose"}), "verbose");
    ctx.assert_equal(verbosity_of({"-s"}), "summary");
    ctx.assert_equal(verbosity_of({"--summary"}), "summary");
    ctx.assert_equal(verbosity_of({"-q"}), "quiet");
    ctx.assert_equal(verbosity_of({"--quiet"}), "quiet");
}

BUNIT_TEST(testParseLastFlagWins) {
    ctx.assert_equal(verbosity_of({"-q", "-v"}), "verbose");
    ctx.assert_equal(verbosity_of({"-v", "--summary", "-q"}), "quiet");
}

BUNIT_TEST(testParseIgnoresUnknownTokens) {
    ctx.assert_equal(verbosity_of({"--bogus", "-s"}), "summary");
    ctx.assert_equal(verbosity_of({"x", "-v", "y"}), "verbose");
    ctx.assert_equal(verbosity_of({"-x"}), "normal");
}

BUNIT_TEST(testParseHelpStopsParsing) {
    Options opts = bunit::parse_args(std::vector<std::string>{"-v", "--help", "-q"});
    ctx.assert_return(opts.help, true);
    ctx.assert_equal(bunit::verbosity_to_string(opts.verbosity), "verbose");

    ctx.assert_return(bunit::parse_args(std::vector<std::string>{"-h"}).help, true);
}

BUNIT_TEST(testParseArgvTakesProgramName) {
    char prog[] = "./my_tests";
    char flag[] = "-s";
    char* argv[] = {prog, flag, nullptr};

    Options opts = bunit::parse_args(2, argv);
    ctx.assert_equal(opts.program, "./my_tests");
    ctx.assert_equal(bunit::verbosity_to_string(opts.verbosity), "summary");
}

// ── print_usage ─────────────────────────────────────────────────────────────

BUNIT_TEST(testUsageText) {
    std::ostringstream out;
    bunit::print_usage(out, "prog");
    ctx.assert_equal(out.str(), kUsage);
}

// ── run ─────────────────────────────────────────────────────────────────────

BUNIT_TEST(testRunWithoutCasesPrintsUsage) {
    Options opts;
    opts.program = "prog";
    std::ostringstream out, err;

    int code = bunit::run(opts, {}, out, err, bunit::ColorMode::Never);
    ctx.assert_return(code, 0);
    ctx.assert_equal(out.str(), kUsage);
}

BUNIT_TEST(testRunHelpRunsNothing) {
    Options opts;
    opts.program = "prog";
    opts.help = true;
    bool ran = false;
    std::vector<TestCase> cases{
        {"testFails", 1, [&](TestContext& c) { ran = true; c.assert_equal("a", "b"); }},
    };
    std::ostringstream out, err;

    int code = bunit::run(opts, cases, out, err, bunit::ColorMode::Never);
    ctx.assert_return(code, 0);
    ctx.assert_return(ran, false);
    ctx.assert_equal(out.str(), kUsage);
}

BUNIT_TEST(testRunPassingCase) {
    Options opts;
    std::vector<TestCase> cases{
        {"testEcho", 1, [](TestContext& c) { c.assert_equal("foo", "foo"); }},
    };
    std::ostringstream out, err;

    int code = bunit::run(opts, cases, out, err, bunit::ColorMode::Never);
    ctx.assert_return(code, 0);
    ctx.assert_matches(out.str(), "testEcho:[0-9]+:Passed\nDone\\. 1 passed\\. 0 failed\\. 0 skipped\\.\n");
}

BUNIT_TEST(testRunQuietFailure) {
    Options opts = bunit::parse_args(std::vector<std::string>{"--quiet"});
    std::vector<TestCase> cases{
        {"testEcho", 1, [](TestContext& c) { c.assert_equal("bar", "foo"); }},
    };
    std::ostringstream out, err;

    int code = bunit::run(opts, cases, out, err, bunit::ColorMode::Never);
    ctx.assert_return(code, 1);
    ctx.assert_equal(out.str(), "");
}

BUNIT_TEST(testRunSummaryOnly) {
    Options opts = bunit::parse_args(std::vector<std::string>{"-s"});
    std::vector<TestCase> cases{
        {"testA", 1, [](TestContext& c) { c.assert_equal("a", "a"); c.skip(); }},
        {"testB", 2, [](TestContext& c) { c.assert_not_equal("a", "a"); }},
    };
    std::ostringstream out, err;

    int code = bunit::run(opts, cases, out, err, bunit::ColorMode::Never);
    ctx.assert_return(code, 1);
    ctx.assert_equal(out.str(), "Done. 1 passed. 1 failed. 1 skipped.\n");
}
