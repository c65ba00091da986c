// ============================================================================
// throwing.cpp - An exception ends its own test case only
// ============================================================================

#include "bunit/bunit.hpp"

#include <stdexcept>

BUNIT_TEST(testThrows) {
    ctx.assert_equal("a", "a");
    throw std::runtime_error("boom");
}

BUNIT_TEST(testAfter) {
    ctx.assert_equal("b", "b");
}

BUNIT_TEST(testThrowsInt) {
    throw 42;
}
