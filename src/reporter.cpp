// ============================================================================
// reporter.cpp - Result lines and the final summary
// ============================================================================

#include "bunit/reporter.hpp"

#include <ostream>

namespace bunit {

Reporter::Reporter(const RunState& state, std::ostream& out, ColorMode mode)
    : state_(state), out_(out), color_(resolve_color(mode)) {}

// ── Per-assertion lines ─────────────────────────────────────────────────────

void Reporter::outcome_line(const Location& loc, std::string_view word,
                            Style style) {
    out_ << paint(loc.test, Style::Name, color_) << ':' << loc.line << ':'
         << paint(word, style, color_) << '\n';
}

void Reporter::passed(const Location& loc) {
    if (!state_.at_least(Verbosity::Normal)) return;
    outcome_line(loc, "Passed", Style::Pass);
}

void Reporter::failed(const Location& loc, std::string_view expected,
                      std::string_view provided) {
    if (!state_.at_least(Verbosity::Normal)) return;
    outcome_line(loc, "Failed", Style::Fail);

    if (state_.verbosity == Verbosity::Verbose) {
        out_ << paint("Expected", Style::Fail, color_) << ": " << expected << '\n'
             << paint("Provided", Style::Fail, color_) << ": " << provided << '\n';
    }
}

void Reporter::skipped(const Location& loc) {
    if (!state_.at_least(Verbosity::Normal)) return;
    outcome_line(loc, "Skipped", Style::Skip);
}

// ── summary ─────────────────────────────────────────────────────────────────

void Reporter::summary() {
    if (!state_.at_least(Verbosity::Summary)) return;
    out_ << "Done. " << state_.passed << " passed. "
         << state_.failed << " failed. "
         << state_.skipped << " skipped.\n";
    out_.flush();
}

}  // namespace bunit
