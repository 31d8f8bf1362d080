// include/tickspec/harness/TestRegistry.hpp
#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tickspec::harness {

class TestContext;

using TestRoutine = std::function<void(TestContext&)>;

struct TestEntry {
    std::string name;
    TestRoutine routine;
};

// Ordered spec list plus an optional focused override. Registration order is
// execution order; the same routine may be registered more than once.
class TestRegistry {
public:
    // Throws std::invalid_argument for an empty routine.
    void Register(std::string name, TestRoutine routine);

    // Runs only this routine, once. A later call replaces an earlier one.
    void Focus(std::string name, TestRoutine routine);
    void ClearFocus() noexcept { m_focused.reset(); }

    // nullptr past the end: the run is exhausted.
    const TestEntry* Lookup(std::size_t index) const noexcept;
    const TestEntry* Focused() const noexcept { return m_focused ? &*m_focused : nullptr; }
    bool             HasFocus() const noexcept { return m_focused.has_value(); }

    std::size_t Size() const noexcept { return m_entries.size(); }

private:
    std::vector<TestEntry>   m_entries;
    std::optional<TestEntry> m_focused;
};

// Process-wide registry filled by TICKSPEC_SPEC during static initialisation.
TestRegistry& GlobalRegistry();

struct Registrar {
    Registrar(const char* name, void (*fn)(TestContext&), bool focus = false);
};

} // namespace tickspec::harness

#define TICKSPEC_CONCAT_INNER_(a, b) a##b
#define TICKSPEC_CONCAT_(a, b) TICKSPEC_CONCAT_INNER_(a, b)

#define TICKSPEC_SPEC_IMPL_(fn, reg, name, focus)                              \
    static void fn(::tickspec::harness::TestContext& ctx);                     \
    static const ::tickspec::harness::Registrar reg(name, &fn, focus);         \
    static void fn([[maybe_unused]] ::tickspec::harness::TestContext& ctx)

// Defines a spec body (parameter `ctx`) and registers it globally.
#define TICKSPEC_SPEC(name)                                                    \
    TICKSPEC_SPEC_IMPL_(TICKSPEC_CONCAT_(tickspec_spec_fn_, __LINE__),         \
                        TICKSPEC_CONCAT_(tickspec_spec_reg_, __LINE__),        \
                        name, false)

// Same, but installs the spec as the focused override.
#define TICKSPEC_FOCUS_SPEC(name)                                              \
    TICKSPEC_SPEC_IMPL_(TICKSPEC_CONCAT_(tickspec_spec_fn_, __LINE__),         \
                        TICKSPEC_CONCAT_(tickspec_spec_reg_, __LINE__),        \
                        name, true)

// Runtime registration named after the function.
#define TICKSPEC_REGISTER(registry, fn) (registry).Register(#fn, (fn))
#define TICKSPEC_FOCUS(registry, fn) (registry).Focus(#fn, (fn))
