// ============================================================================
// bunit/terminal.hpp - Colour capability check and styled text
// ============================================================================
//
// Result lines use ANSI colours only when the destination can show them.
// The decision is made once, when a Reporter is built:
//
//   ColorMode::Auto    -> supports_color(stdout)
//   ColorMode::Always  -> colours on (tests, forced output)
//   ColorMode::Never   -> plain text
//
// ============================================================================

#ifndef BUNIT_TERMINAL_HPP
#define BUNIT_TERMINAL_HPP

#include <cstdio>
#include <string>
#include <string_view>

namespace bunit {

// ── ColorMode ───────────────────────────────────────────────────────────────

enum class ColorMode {
    Auto,
    Always,
    Never
};

// ── Style ───────────────────────────────────────────────────────────────────

enum class Style {
    Name,     // bold white: test case names
    Pass,     // green
    Fail,     // red
    Skip      // yellow
};

/// Environment part of the check: TERM (`term`) must be set, non-empty
/// and not "dumb", and NO_COLOR (`no_color`) must be unset or empty.
/// Either argument may be null.
bool color_allowed(const char* term, const char* no_color) noexcept;

/// True if `stream` is a terminal that can render ANSI colours:
/// it must be a TTY, TERM must be set and not "dumb", and NO_COLOR
/// must be unset or empty.
bool supports_color(std::FILE* stream);

/// Resolve a ColorMode against stdout.
bool resolve_color(ColorMode mode);

/// Wrap `text` in the escape sequence for `style` when `enabled`,
/// otherwise return it unchanged.
std::string paint(std::string_view text, Style style, bool enabled);

}  // namespace bunit

#endif  // BUNIT_TERMINAL_HPP
