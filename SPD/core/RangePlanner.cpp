#include "RangePlanner.h"

#include <algorithm>

std::optional<std::vector<RangeSpec>> RangePlanner::plan(std::int64_t totalSize, int workerCount) {
    if (workerCount < 1 || totalSize < 0)
        return std::nullopt;

    std::vector<RangeSpec> ranges;
    if (totalSize == 0)
        return ranges;

    const std::int64_t count = std::min<std::int64_t>(workerCount, totalSize);
    const std::int64_t chunkSize = totalSize / count;

    ranges.reserve(static_cast<std::size_t>(count));
    for (std::int64_t i = 0; i < count; ++i) {
        const std::int64_t start = i * chunkSize;
        const std::int64_t end = (i == count - 1)
            ? totalSize - 1
            : start + chunkSize - 1;

        ranges.push_back({ static_cast<int>(i), start, end });
    }

    return ranges;
}
