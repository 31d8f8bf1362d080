// src/harness/RunSummary.cpp
#include "tickspec/harness/RunSummary.hpp"

namespace tickspec::harness {

std::string FormatSummary(const RunSummary& summary)
{
    if (summary.failures > 0)
        return std::to_string(summary.Total()) + " examples, " + std::to_string(summary.failures) + " failures";

    return std::to_string(summary.passes) + " examples, 0 failures";
}

} // namespace tickspec::harness
