// include/tickspec/harness/RunSummary.hpp
#pragma once
#include <cstddef>
#include <string>

namespace tickspec::harness {

struct RunSummary {
    std::size_t passes   = 0;
    std::size_t failures = 0;

    std::size_t Total() const noexcept { return passes + failures; }
    bool        Succeeded() const noexcept { return failures == 0; }
};

// "<total> examples, <failures> failures", or "<passes> examples, 0 failures".
std::string FormatSummary(const RunSummary& summary);

} // namespace tickspec::harness
