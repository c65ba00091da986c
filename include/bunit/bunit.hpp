// ============================================================================
// bunit/bunit.hpp - Everything a test program needs
// ============================================================================
//
// A test program includes this header, declares its cases with BUNIT_TEST
// and links bunit_main (or calls bunit::run_main from its own main()).
//
// ============================================================================

#ifndef BUNIT_BUNIT_HPP
#define BUNIT_BUNIT_HPP

#include "bunit/cli.hpp"
#include "bunit/command.hpp"
#include "bunit/context.hpp"
#include "bunit/registry.hpp"
#include "bunit/reporter.hpp"
#include "bunit/run_state.hpp"
#include "bunit/runner.hpp"

#endif  // BUNIT_BUNIT_HPP
