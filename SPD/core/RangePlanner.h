#pragma once
#include <vector>
#include <optional>
#include <cstdint>
#include "utils.h"

// Splits [0, totalSize) into contiguous inclusive ranges, one per worker.
// Every range but the last spans totalSize / workerCount bytes; the last one
// absorbs the remainder. When totalSize < workerCount only totalSize
// one-byte ranges are produced, and totalSize == 0 produces no ranges.
// Returns std::nullopt for workerCount < 1 or totalSize < 0.
class RangePlanner {
public:
    static std::optional<std::vector<RangeSpec>> plan(std::int64_t totalSize, int workerCount);
};
