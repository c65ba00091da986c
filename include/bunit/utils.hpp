// ============================================================================
// bunit/utils.hpp - Utility functions
// ============================================================================

#ifndef BUNIT_UTILS_HPP
#define BUNIT_UTILS_HPP

#include <string>

namespace bunit {

// ── String helpers ──────────────────────────────────────────────────────────

/// Remove every trailing '\n' (and nothing else) from `s`.
std::string strip_trailing_newlines(const std::string& s);

// ── Exit codes ──────────────────────────────────────────────────────────────

/// Largest value a POSIX exit status can carry.
constexpr int kMaxExitCode = 255;

/// Map a failure count to a process exit code, saturating at
/// kMaxExitCode so that 256 failures never read as success.
int exit_code_for(int failures) noexcept;

}  // namespace bunit

#endif  // BUNIT_UTILS_HPP
