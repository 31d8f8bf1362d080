// src/harness/TestRegistry.cpp
#include "tickspec/harness/TestRegistry.hpp"
#include "tickspec/harness/TestContext.hpp"

#include <stdexcept>
#include <utility>

namespace tickspec::harness {

void TestRegistry::Register(std::string name, TestRoutine routine)
{
    if (!routine)
        throw std::invalid_argument("TestRegistry::Register: empty routine for '" + name + "'");
    m_entries.push_back(TestEntry{std::move(name), std::move(routine)});
}

void TestRegistry::Focus(std::string name, TestRoutine routine)
{
    if (!routine)
        throw std::invalid_argument("TestRegistry::Focus: empty routine for '" + name + "'");
    m_focused = TestEntry{std::move(name), std::move(routine)};
}

const TestEntry* TestRegistry::Lookup(std::size_t index) const noexcept
{
    return index < m_entries.size() ? &m_entries[index] : nullptr;
}

TestRegistry& GlobalRegistry()
{
    static TestRegistry registry;
    return registry;
}

Registrar::Registrar(const char* name, void (*fn)(TestContext&), bool focus)
{
    if (focus)
        GlobalRegistry().Focus(name, fn);
    else
        GlobalRegistry().Register(name, fn);
}

} // namespace tickspec::harness
