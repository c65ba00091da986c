// ============================================================================
// bunit/runner.hpp - Sequential execution of discovered test cases
// ============================================================================
//
// Each case gets its own TestContext bound to the shared RunState.  Cases
// run one after another; a failed assertion or an exception escaping a
// case never stops the ones after it.
//
// ============================================================================

#ifndef BUNIT_RUNNER_HPP
#define BUNIT_RUNNER_HPP

#include "bunit/registry.hpp"
#include "bunit/reporter.hpp"
#include "bunit/run_state.hpp"

#include <iosfwd>
#include <vector>

namespace bunit {

// ── TestRunner ──────────────────────────────────────────────────────────────

class TestRunner {
public:
    /// `err` receives diagnostics for exceptions escaping a test body.
    TestRunner(RunState& state, Reporter& reporter, std::ostream& err);

    /// Run one case to completion.
    void run(const TestCase& tc);

    /// Print the summary and return the exit code (failed count,
    /// saturated at 255).
    int summarise();

    int cases_run() const noexcept { return cases_run_; }
    int cases_aborted() const noexcept { return cases_aborted_; }

private:
    RunState&     state_;
    Reporter&     reporter_;
    std::ostream& err_;
    int           cases_run_     = 0;
    int           cases_aborted_ = 0;
};

/// Run every case in order, then summarise.  Returns the exit code.
int run_tests(const std::vector<TestCase>& cases, RunState& state,
              Reporter& reporter, std::ostream& err);

}  // namespace bunit

#endif  // BUNIT_RUNNER_HPP
