// ============================================================================
// bunit/command.hpp - Run a shell command and capture its result
// ============================================================================
//
// Usage:
//   auto r = bunit::run_command("echo foo");
//   ctx.assert_equal(r.output, "foo");
//   ctx.assert_return(r, 0);
//
// ============================================================================

#ifndef BUNIT_COMMAND_HPP
#define BUNIT_COMMAND_HPP

#include <string>

namespace bunit {

// ── CommandResult ───────────────────────────────────────────────────────────

struct CommandResult {
    std::string output;   // captured stdout, trailing newlines removed
    int         status = 0;  // exit status, or 128 + signal if killed
};

/// Run `command` with /bin/sh -c and capture its standard output.
/// Standard error is not captured.  Trailing newlines are stripped the
/// way shell command substitution strips them; everything else,
/// including embedded newlines and leading whitespace, is kept.
/// Throws std::runtime_error if the shell cannot be started.
CommandResult run_command(const std::string& command);

}  // namespace bunit

#endif  // BUNIT_COMMAND_HPP
