// include/tickspec/harness/SchedulerState.hpp
#pragma once
#include <cstddef>

namespace tickspec::harness {

// Progress of a harness run. Replays of one spec leave iteration/delay
// alone; ResetForNextTest runs only at the boundary between two specs.
struct SchedulerState {
    std::size_t currentTestIndex     = 0;     // next registry slot (ignored while focused)
    std::size_t currentTestIteration = 0;     // replays so far of the running spec
    bool        wantsReplay          = false; // set by the running spec
    double      delayBeforeNextRun   = 0.0;   // seconds of frame time before the next invocation

    void ResetForNextTest() noexcept {
        currentTestIteration = 0;
        wantsReplay          = false;
        delayBeforeNextRun   = 0.0;
    }
};

} // namespace tickspec::harness
