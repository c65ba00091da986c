// ============================================================================
// context.cpp - Assertion primitives
// ============================================================================

#include "bunit/context.hpp"

#include <string>
#include <utility>

#include <regex.h>

namespace bunit {

namespace {

// ── Pattern matching ────────────────────────────────────────────────────────

struct PatternVerdict {
    bool        valid   = true;
    bool        matched = false;
    std::string error;
};

// Owns a compiled POSIX regex.
struct CompiledPattern {
    regex_t re{};
    int     rc = 0;

    explicit CompiledPattern(const std::string& pattern)
        : rc(regcomp(&re, pattern.c_str(), REG_EXTENDED)) {}
    ~CompiledPattern() {
        if (rc == 0) regfree(&re);
    }

    CompiledPattern(const CompiledPattern&) = delete;
    CompiledPattern& operator=(const CompiledPattern&) = delete;

    std::string error(int code) const {
        char buf[256];
        regerror(code, &re, buf, sizeof(buf));
        return buf;
    }
};

// Full match, or match anchored at the start only when `prefix` is set.
// regexec reports the leftmost-longest match, so a match starting at 0 is
// found whenever one exists, and it spans the subject whenever that can.
PatternVerdict match_pattern(std::string_view output, std::string_view pattern,
                             bool prefix) {
    PatternVerdict v;
    CompiledPattern compiled{std::string(pattern)};
    if (compiled.rc != 0) {
        v.valid = false;
        v.error = compiled.error(compiled.rc);
        return v;
    }

    std::string subject(output);
    regmatch_t m[1];
    m[0].rm_so = 0;
    m[0].rm_eo = static_cast<regoff_t>(subject.size());

    int rc = regexec(&compiled.re, subject.c_str(), 1, m, REG_STARTEND);
    if (rc == REG_NOMATCH) {
        return v;
    }
    if (rc != 0) {
        v.valid = false;
        v.error = compiled.error(rc);
        return v;
    }

    const auto size = static_cast<regoff_t>(subject.size());
    v.matched = m[0].rm_so == 0 && (prefix || m[0].rm_eo == size);
    return v;
}

}  // namespace

// ── TestContext ──────────────────────────────────────────────────────────────

TestContext::TestContext(std::string test_name, RunState& state,
                         Reporter& reporter)
    : name_(std::move(test_name)), state_(state), reporter_(reporter) {}

void TestContext::record(bool ok, unsigned line, std::string_view expected,
                         std::string_view provided) {
    ++checks_;
    Location loc{name_, line};
    if (ok) {
        ++state_.passed;
        reporter_.passed(loc);
    } else {
        ++state_.failed;
        reporter_.failed(loc, expected, provided);
    }
}

void TestContext::record_pattern(std::string_view output,
                                 std::string_view pattern, bool prefix,
                                 bool want_match, unsigned line) {
    PatternVerdict v = match_pattern(output, pattern, prefix);
    if (!v.valid) {
        std::string provided(output);
        provided += " (invalid pattern: " + v.error + ")";
        record(false, line, pattern, provided);
        return;
    }
    record(v.matched == want_match, line, pattern, output);
}

// ── Literal comparisons ─────────────────────────────────────────────────────

void TestContext::assert_equal(std::string_view output,
                               std::string_view expected, where_t where) {
    record(output == expected, where.line(), expected, output);
}

void TestContext::assert_not_equal(std::string_view output,
                                   std::string_view expected, where_t where) {
    record(output != expected, where.line(), expected, output);
}

// ── Pattern comparisons ─────────────────────────────────────────────────────

void TestContext::assert_matches(std::string_view output,
                                 std::string_view pattern, where_t where) {
    record_pattern(output, pattern, false, true, where.line());
}

void TestContext::assert_not_matches(std::string_view output,
                                     std::string_view pattern, where_t where) {
    record_pattern(output, pattern, false, false, where.line());
}

void TestContext::assert_starts_with(std::string_view output,
                                     std::string_view pattern, where_t where) {
    record_pattern(output, pattern, true, true, where.line());
}

// ── Return codes ────────────────────────────────────────────────────────────

void TestContext::assert_return(int status, int expected, where_t where) {
    record(status == expected, where.line(), std::to_string(expected),
           std::to_string(status));
}

void TestContext::assert_return(const CommandResult& result, int expected,
                                where_t where) {
    assert_return(result.status, expected, where);
}

void TestContext::assert_not_return(int status, int expected, where_t where) {
    record(status != expected, where.line(), std::to_string(expected),
           std::to_string(status));
}

void TestContext::assert_not_return(const CommandResult& result, int expected,
                                    where_t where) {
    assert_not_return(result.status, expected, where);
}

// ── skip ────────────────────────────────────────────────────────────────────

void TestContext::skip(where_t where) {
    ++checks_;
    ++state_.skipped;
    reporter_.skipped(Location{name_, where.line()});
}

}  // namespace bunit
