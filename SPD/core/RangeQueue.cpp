#include "RangeQueue.h"

#include <algorithm>

RangeQueue::RangeQueue(const std::vector<RangeSpec>& specs)
    : ranges(specs),
    states(specs.size(), RangeState::Pending) {
}

std::optional<RangeSpec> RangeQueue::getNext() {
    std::lock_guard<std::mutex> lock(mtx);
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        if (states[i] == RangeState::Pending) {
            states[i] = RangeState::InProgress;
            return ranges[i];
        }
    }
    return std::nullopt;
}

void RangeQueue::markDone(int rangeIndex) {
    setState(rangeIndex, RangeState::Done);
}

void RangeQueue::markFailed(int rangeIndex) {
    setState(rangeIndex, RangeState::Failed);
}

void RangeQueue::setState(int rangeIndex, RangeState state) {
    std::lock_guard<std::mutex> lock(mtx);
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        if (ranges[i].index == rangeIndex) {
            states[i] = state;
            break;
        }
    }
}

std::size_t RangeQueue::countIn(RangeState state) const {
    std::lock_guard<std::mutex> lock(mtx);
    return static_cast<std::size_t>(std::count(states.begin(), states.end(), state));
}
