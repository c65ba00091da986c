// ============================================================================
// registry.cpp - Test case registration and discovery
// ============================================================================

#include "bunit/registry.hpp"

#include <stdexcept>
#include <utility>

namespace bunit {

// ── Registry ────────────────────────────────────────────────────────────────

Registry& Registry::instance() {
    static Registry registry;
    return registry;
}

void Registry::add(std::string name, unsigned line, TestFunc fn) {
    if (!is_test_name(name)) {
        throw std::invalid_argument("invalid test case name: '" + name + "'");
    }
    if (!fn) {
        throw std::invalid_argument("test case '" + name + "' has no body");
    }

    for (auto& tc : cases_) {
        if (tc.name == name) {
            tc.line = line;
            tc.fn = std::move(fn);
            return;
        }
    }
    cases_.push_back(TestCase{std::move(name), line, std::move(fn)});
}

std::vector<TestCase> discover() {
    return Registry::instance().cases();
}

// ── Registrar ───────────────────────────────────────────────────────────────

Registrar::Registrar(const char* name, unsigned line,
                     void (*fn)(TestContext&)) {
    Registry::instance().add(name, line, fn);
}

}  // namespace bunit
