// include/tickspec/harness/Assertions.hpp
#pragma once
#include <stdexcept>
#include <string>

#include "tickspec/harness/StackTrace.hpp"

namespace tickspec::harness {

// Thrown by the failure primitives below. Captures the stack at the throw
// site so the failure report can point into the spec body.
class TestFailure : public std::runtime_error {
public:
    TestFailure(const std::string& message, const char* file, int line);

    const char*        File() const noexcept { return m_file; }
    int                Line() const noexcept { return m_line; }
    const StackFrames& Trace() const noexcept { return m_trace; }

private:
    const char* m_file;
    int         m_line;
    StackFrames m_trace;
};

// Fails the running spec.
[[noreturn]] void Fail(const std::string& message, const char* file = nullptr, int line = 0);

// Fails only when |a - b| > epsilon, so a NaN difference (NaN input, inf - inf) passes.
[[nodiscard]] bool ApproxEq(double a, double b, double epsilon) noexcept;

// Fails the running spec unless ApproxEq(a, b, epsilon).
void AssertApproxEq(double a, double b, double epsilon,
                    const char* a_expr, const char* b_expr, const char* epsilon_expr,
                    const char* file, int line);

} // namespace tickspec::harness

#define TICKSPEC_ASSERT_APPROX_EQ(a, b, epsilon)                               \
    ::tickspec::harness::AssertApproxEq(                                       \
        static_cast<double>(a), static_cast<double>(b),                        \
        static_cast<double>(epsilon), #a, #b, #epsilon, __FILE__, __LINE__)

#define TICKSPEC_REQUIRE(expr)                                                 \
    do {                                                                       \
        if (!(expr))                                                           \
            ::tickspec::harness::Fail("requirement failed: " #expr,            \
                                      __FILE__, __LINE__);                     \
    } while (false)

#define TICKSPEC_FAIL(message)                                                 \
    ::tickspec::harness::Fail((message), __FILE__, __LINE__)
