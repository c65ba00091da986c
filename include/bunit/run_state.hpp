// ============================================================================
// bunit/run_state.hpp - Counters and verbosity for one test run
// ============================================================================
//
// A RunState is owned by the driver (run_main or a test of the harness) and
// handed by reference to every TestContext and to the Reporter.  Only the
// assertion primitives touch the counters; only the CLI touches verbosity,
// and only before the first test case runs.
//
// ============================================================================

#ifndef BUNIT_RUN_STATE_HPP
#define BUNIT_RUN_STATE_HPP

namespace bunit {

// ── Verbosity ───────────────────────────────────────────────────────────────

enum class Verbosity {
    Quiet   = 0,  // nothing on stdout, exit code only
    Summary = 1,  // final "Done." line only
    Normal  = 2,  // one line per assertion + summary
    Verbose = 3   // as Normal, plus expected/provided on failures
};

/// Return "quiet", "summary", "normal" or "verbose".
const char* verbosity_to_string(Verbosity v) noexcept;

// ── RunState ────────────────────────────────────────────────────────────────

struct RunState {
    int       passed    = 0;
    int       failed    = 0;
    int       skipped   = 0;
    Verbosity verbosity = Verbosity::Normal;

    /// Number of assertion calls recorded so far (skips included).
    int total() const noexcept { return passed + failed + skipped; }

    /// True if output at level `level` is enabled.
    bool at_least(Verbosity level) const noexcept {
        return static_cast<int>(verbosity) >= static_cast<int>(level);
    }
};

}  // namespace bunit

#endif  // BUNIT_RUN_STATE_HPP
