// ============================================================================
// echo_pass.cpp - One passing assertion on captured command output
// ============================================================================

#include "bunit/bunit.hpp"

BUNIT_TEST(testEcho) {
    ctx.assert_equal(bunit::run_command("echo foo").output, "foo");
}
