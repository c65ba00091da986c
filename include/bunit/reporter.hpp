// ============================================================================
// bunit/reporter.hpp - Result lines and the final summary
// ============================================================================
//
// Output format (one line per assertion, verbosity >= Normal):
//
//   testEcho:12:Passed
//   testEcho:13:Failed
//   Expected: foo          <- verbosity == Verbose, failures only
//   Provided: bar
//   testEcho:14:Skipped
//   Done. 1 passed. 1 failed. 1 skipped.   <- verbosity >= Summary
//
// ============================================================================

#ifndef BUNIT_REPORTER_HPP
#define BUNIT_REPORTER_HPP

#include "bunit/run_state.hpp"
#include "bunit/terminal.hpp"

#include <iosfwd>
#include <string_view>

namespace bunit {

// ── Location ────────────────────────────────────────────────────────────────
// Where an outcome is attributed: the running test case and the line of
// the assertion call inside it.

struct Location {
    std::string_view test;
    unsigned         line = 0;
};

// ── Reporter ────────────────────────────────────────────────────────────────

class Reporter {
public:
    /// The state is read for verbosity gating only.  Colour is resolved
    /// once here; ColorMode::Auto checks stdout.
    Reporter(const RunState& state, std::ostream& out,
             ColorMode mode = ColorMode::Auto);

    void passed(const Location& loc);
    void failed(const Location& loc, std::string_view expected,
                std::string_view provided);
    void skipped(const Location& loc);

    /// "Done. <p> passed. <f> failed. <s> skipped." unless Quiet.
    void summary();

    bool color() const noexcept { return color_; }

private:
    void outcome_line(const Location& loc, std::string_view word, Style style);

    const RunState& state_;
    std::ostream&   out_;
    bool            color_;
};

}  // namespace bunit

#endif  // BUNIT_REPORTER_HPP
