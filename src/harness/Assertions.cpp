// src/harness/Assertions.cpp
#include "tickspec/harness/Assertions.hpp"

#include <cmath>
#include <sstream>

namespace tickspec::harness {

TestFailure::TestFailure(const std::string& message, const char* file, int line)
    : std::runtime_error(message)
    , m_file(file)
    , m_line(line)
    , m_trace(CaptureStackTrace())
{
}

void Fail(const std::string& message, const char* file, int line)
{
    throw TestFailure(message, file, line);
}

bool ApproxEq(double a, double b, double epsilon) noexcept
{
    return !(std::fabs(a - b) > epsilon);
}

void AssertApproxEq(double a, double b, double epsilon,
                    const char* a_expr, const char* b_expr, const char* epsilon_expr,
                    const char* file, int line)
{
    if (ApproxEq(a, b, epsilon))
        return;

    std::ostringstream oss;
    oss << "assertion failed: |" << a_expr << " - " << b_expr << "| <= " << epsilon_expr
        << ". Values: " << a << " and " << b;
    Fail(oss.str(), file, line);
}

} // namespace tickspec::harness
