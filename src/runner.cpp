// ============================================================================
// runner.cpp - Sequential execution of discovered test cases
// ============================================================================

#include "bunit/runner.hpp"
#include "bunit/utils.hpp"

#include <cstdio>
#include <exception>
#include <iostream>

namespace bunit {

// Result lines, printf output from test bodies and the error stream must
// appear in the order they were produced.
static void flush_stdout() {
    std::cout.flush();
    std::fflush(stdout);
}

// ── TestRunner ──────────────────────────────────────────────────────────────

TestRunner::TestRunner(RunState& state, Reporter& reporter, std::ostream& err)
    : state_(state), reporter_(reporter), err_(err) {}

void TestRunner::run(const TestCase& tc) {
    ++cases_run_;
    TestContext ctx(tc.name, state_, reporter_);

    try {
        tc.fn(ctx);
    } catch (const std::exception& e) {
        // Not an assertion: the counters stay as they are.
        ++cases_aborted_;
        flush_stdout();
        err_ << "ERROR: " << tc.name << ": " << e.what() << "\n";
    } catch (...) {
        ++cases_aborted_;
        flush_stdout();
        err_ << "ERROR: " << tc.name << ": unknown exception\n";
    }
}

int TestRunner::summarise() {
    reporter_.summary();
    return exit_code_for(state_.failed);
}

// ── run_tests ───────────────────────────────────────────────────────────────

int run_tests(const std::vector<TestCase>& cases, RunState& state,
              Reporter& reporter, std::ostream& err) {
    TestRunner runner(state, reporter, err);
    for (const auto& tc : cases) {
        runner.run(tc);
    }
    return runner.summarise();
}

}  // namespace bunit
