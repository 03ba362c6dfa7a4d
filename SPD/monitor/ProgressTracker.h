#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../core/utils.h"

// Byte accounting for one fetch phase, per part and overall.
// Only the thread draining worker reports touches it.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    void begin(std::int64_t totalBytes, const std::vector<RangeSpec>& ranges);
    void add(int rangeIndex, std::int64_t bytes);

    std::int64_t downloaded() const { return downloadedBytes; }
    std::int64_t total() const { return totalBytes; }
    std::int64_t partBytes(int rangeIndex) const;
    std::size_t partsReceiving() const;

    double percent() const;
    double elapsedSeconds() const;
    double megabitsPerSec() const;

    // True at most once per interval
    bool due(Clock::time_point now, std::chrono::milliseconds interval = std::chrono::seconds(1));

    // "Progress: <done>/<total> bytes (<pct>%), <k>/<n> parts receiving"
    std::string line() const;

private:
    std::int64_t totalBytes = 0;
    std::int64_t downloadedBytes = 0;
    std::vector<std::int64_t> perPart;
    Clock::time_point started = Clock::now();
    Clock::time_point lastReport = started;
};
