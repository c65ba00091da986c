// ============================================================================
// bunit/registry.hpp - Test case registration and discovery
// ============================================================================
//
// Test cases register themselves while the program is loaded:
//
//   BUNIT_TEST(testEcho) {
//       ctx.assert_equal(bunit::run_command("echo foo").output, "foo");
//   }
//
// Names must match test[A-Za-z0-9_]+; the macro rejects anything else at
// compile time.  discover() lists the cases in registration order, which
// within one source file is declaration order.  Registering a name twice
// keeps the first position and the last body.
//
// ============================================================================

#ifndef BUNIT_REGISTRY_HPP
#define BUNIT_REGISTRY_HPP

#include "bunit/context.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace bunit {

// ── Naming convention ───────────────────────────────────────────────────────

/// True if `name` is "test" followed by at least one of [A-Za-z0-9_].
constexpr bool is_test_name(std::string_view name) noexcept {
    constexpr std::string_view prefix = "test";
    if (name.size() <= prefix.size() || name.substr(0, prefix.size()) != prefix) {
        return false;
    }
    for (char c : name.substr(prefix.size())) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return true;
}

// ── TestCase ────────────────────────────────────────────────────────────────

using TestFunc = std::function<void(TestContext&)>;

struct TestCase {
    std::string name;
    unsigned    line = 0;   // line of the declaration
    TestFunc    fn;
};

// ── Registry ────────────────────────────────────────────────────────────────

class Registry {
public:
    /// The process-wide registry filled by BUNIT_TEST.
    static Registry& instance();

    /// Append a case, or replace the body of an existing one with the
    /// same name.  Throws std::invalid_argument if `name` breaks the
    /// naming convention or `fn` is empty.
    void add(std::string name, unsigned line, TestFunc fn);

    /// Registered cases, in first-registration order.
    const std::vector<TestCase>& cases() const noexcept { return cases_; }

    std::size_t size() const noexcept { return cases_.size(); }

private:
    std::vector<TestCase> cases_;
};

/// Snapshot of the process-wide registry.
std::vector<TestCase> discover();

// ── Registrar ───────────────────────────────────────────────────────────────

struct Registrar {
    Registrar(const char* name, unsigned line, void (*fn)(TestContext&));
};

}  // namespace bunit

#define BUNIT_TEST(name)                                                      \
    static_assert(::bunit::is_test_name(#name),                               \
                  "test case names must match test[A-Za-z0-9_]+");            \
    static void name([[maybe_unused]] ::bunit::TestContext& ctx);             \
    static const ::bunit::Registrar bunit_registrar_##name(#name, __LINE__,   \
                                                           &name);            \
    static void name([[maybe_unused]] ::bunit::TestContext& ctx)

#endif  // BUNIT_REGISTRY_HPP
