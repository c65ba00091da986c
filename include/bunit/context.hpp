// ============================================================================
// bunit/context.hpp - Assertion primitives
// ============================================================================
//
// Every test case receives a TestContext.  Each assertion decides a
// verdict, bumps exactly one RunState counter and hands the outcome to the
// Reporter.  Nothing is thrown on failure: the test case keeps running.
//
// The line reported for an outcome is the line of the call, captured by
// the defaulted std::source_location argument.
//
// Usage:
//   BUNIT_TEST(testEcho) {
//       auto r = bunit::run_command("echo foo");
//       ctx.assert_equal(r.output, "foo");
//       ctx.assert_return(r, 0);
//   }
//
// ============================================================================

#ifndef BUNIT_CONTEXT_HPP
#define BUNIT_CONTEXT_HPP

#include "bunit/command.hpp"
#include "bunit/reporter.hpp"
#include "bunit/run_state.hpp"

#include <source_location>
#include <string>
#include <string_view>

namespace bunit {

// ── TestContext ─────────────────────────────────────────────────────────────

class TestContext {
public:
    using where_t = std::source_location;

    TestContext(std::string test_name, RunState& state, Reporter& reporter);

    // ── Literal comparisons ─────────────────────────────────────────────

    /// Pass iff `output` equals `expected` byte for byte.
    void assert_equal(std::string_view output, std::string_view expected,
                      where_t where = where_t::current());

    /// Pass iff `output` differs from `expected`.
    void assert_not_equal(std::string_view output, std::string_view expected,
                          where_t where = where_t::current());

    // ── Pattern comparisons (POSIX extended regex) ──────────────────────
    // An invalid pattern is a failed assertion.

    /// Pass iff `pattern` matches the whole of `output`.
    void assert_matches(std::string_view output, std::string_view pattern,
                        where_t where = where_t::current());

    /// Pass iff `pattern` does not match the whole of `output`.
    void assert_not_matches(std::string_view output, std::string_view pattern,
                            where_t where = where_t::current());

    /// Pass iff `pattern` matches a prefix of `output`.
    void assert_starts_with(std::string_view output, std::string_view pattern,
                            where_t where = where_t::current());

    // ── Return codes ────────────────────────────────────────────────────

    void assert_return(int status, int expected,
                       where_t where = where_t::current());
    void assert_return(const CommandResult& result, int expected,
                       where_t where = where_t::current());

    void assert_not_return(int status, int expected,
                           where_t where = where_t::current());
    void assert_not_return(const CommandResult& result, int expected,
                           where_t where = where_t::current());

    // ── skip ────────────────────────────────────────────────────────────

    /// Record a skip.  Does not return from the test case.
    void skip(where_t where = where_t::current());

    const std::string& name() const noexcept { return name_; }

    /// Assertions recorded by this context (skips included).
    int checks() const noexcept { return checks_; }

private:
    void record(bool ok, unsigned line, std::string_view expected,
                std::string_view provided);
    void record_pattern(std::string_view output, std::string_view pattern,
                        bool prefix, bool want_match, unsigned line);

    std::string name_;
    RunState&   state_;
    Reporter&   reporter_;
    int         checks_ = 0;
};

}  // namespace bunit

#endif  // BUNIT_CONTEXT_HPP
