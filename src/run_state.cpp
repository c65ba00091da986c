// ============================================================================
// run_state.cpp - Verbosity names
// ============================================================================

#include "bunit/run_state.hpp"

namespace bunit {

const char* verbosity_to_string(Verbosity v) noexcept {
    switch (v) {
        case Verbosity::Quiet:   return "quiet";
        case Verbosity::Summary: return "summary";
        case Verbosity::Normal:  return "normal";
        case Verbosity::Verbose: return "verbose";
    }
    return "unknown";
}

}  // namespace bunit
