#pragma once
#include <vector>
#include <mutex>
#include <optional>
#include <cstddef>
#include "utils.h"

class RangeQueue {
public:
    explicit RangeQueue(const std::vector<RangeSpec>& ranges);

    std::optional<RangeSpec> getNext();
    void markDone(int rangeIndex);
    void markFailed(int rangeIndex);

    std::size_t countIn(RangeState state) const;

private:
    void setState(int rangeIndex, RangeState state);

private:
    std::vector<RangeSpec> ranges;
    std::vector<RangeState> states;
    mutable std::mutex mtx;
};
