// ============================================================================
// command_tests.cpp - Shell command capture
// ============================================================================

#include "test_support.hpp"

#include "bunit/utils.hpp"

#include <string>

BUNIT_TEST(testCommandCapturesStdout) {
    auto r = bunit::run_command("echo foo");
    ctx.assert_equal(r.output, "foo");
    ctx.assert_return(r, 0);
}

BUNIT_TEST(testCommandKeepsInnerWhitespace) {
    auto r = bunit::run_command("printf '  a  b\\n\\nc \\n\\n\\n'");
    ctx.assert_equal(r.output, "  a  b\n\nc ");
}

BUNIT_TEST(testCommandExitStatus) {
    ctx.assert_return(bunit::run_command("exit 3"), 3);
    ctx.assert_return(bunit::run_command("false"), 1);
    ctx.assert_not_return(bunit::run_command("false"), 0);
}

BUNIT_TEST(testCommandKilledBySignal) {
    auto r = bunit::run_command("kill -TERM $$");
    ctx.assert_return(r, 128 + 15);
}

BUNIT_TEST(testCommandStderrNotCaptured) {
    auto r = bunit::run_command("echo visible; echo hidden 1>&2");
    ctx.assert_equal(r.output, "visible");
}

BUNIT_TEST(testCommandEmptyOutput) {
    auto r = bunit::run_command("true");
    ctx.assert_equal(r.output, "");
    ctx.assert_return(r, 0);
}

// ── strip_trailing_newlines ─────────────────────────────────────────────────

BUNIT_TEST(testStripTrailingNewlines) {
    ctx.assert_equal(bunit::strip_trailing_newlines("a\n\n"), "a");
    ctx.assert_equal(bunit::strip_trailing_newlines("\n\n"), "");
    ctx.assert_equal(bunit::strip_trailing_newlines("a \n b"), "a \n b");
    ctx.assert_equal(bunit::strip_trailing_newlines("a\r\n"), "a\r");
}
