// ============================================================================
// utils.cpp - String and exit code utilities
// ============================================================================

#include "bunit/utils.hpp"

namespace bunit {

// ── strip_trailing_newlines ─────────────────────────────────────────────────

std::string strip_trailing_newlines(const std::string& s) {
    auto end = s.find_last_not_of('\n');
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

// ── exit_code_for ───────────────────────────────────────────────────────────

int exit_code_for(int failures) noexcept {
    if (failures <= 0) return 0;
    if (failures > kMaxExitCode) return kMaxExitCode;
    return failures;
}

}  // namespace bunit
