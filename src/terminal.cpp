// ============================================================================
// terminal.cpp - Colour capability check and styled text
// ============================================================================

#include "bunit/terminal.hpp"

#include <cstdlib>
#include <cstring>

#include <unistd.h>

namespace bunit {

namespace {

const char* escape_for(Style style) {
    switch (style) {
        case Style::Name: return "\033[37;1m";
        case Style::Pass: return "\033[32m";
        case Style::Fail: return "\033[31m";
        case Style::Skip: return "\033[33m";
    }
    return "";
}

constexpr const char* kReset = "\033[0m";

}  // namespace

// ── color_allowed ─────────────────────────────────────────────────────────

bool color_allowed(const char* term, const char* no_color) noexcept {
    // https://no-color.org: any non-empty value disables colour.
    if (no_color != nullptr && no_color[0] != '\0') {
        return false;
    }
    if (term == nullptr || term[0] == '\0') {
        return false;
    }
    return std::strcmp(term, "dumb") != 0;
}

// ── supports_color ──────────────────────────────────────────────────────────

bool supports_color(std::FILE* stream) {
    if (stream == nullptr || !isatty(fileno(stream))) {
        return false;
    }
    return color_allowed(std::getenv("TERM"), std::getenv("NO_COLOR"));
}

// ── resolve_color ───────────────────────────────────────────────────────────

bool resolve_color(ColorMode mode) {
    switch (mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never:  return false;
        case ColorMode::Auto:   break;
    }
    return supports_color(stdout);
}

// ── paint ───────────────────────────────────────────────────────────────────

std::string paint(std::string_view text, Style style, bool enabled) {
    if (!enabled) {
        return std::string(text);
    }
    std::string out = escape_for(style);
    out += text;
    out += kReset;
    return out;
}

}  // namespace bunit
