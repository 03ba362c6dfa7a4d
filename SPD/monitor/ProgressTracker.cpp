#include "ProgressTracker.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

void ProgressTracker::begin(std::int64_t total, const std::vector<RangeSpec>& ranges) {
    totalBytes = total;
    downloadedBytes = 0;
    perPart.assign(ranges.size(), 0);
    started = Clock::now();
    lastReport = started;
}

void ProgressTracker::add(int rangeIndex, std::int64_t bytes) {
    downloadedBytes += bytes;
    if (rangeIndex >= 0 && static_cast<std::size_t>(rangeIndex) < perPart.size())
        perPart[rangeIndex] += bytes;
}

std::int64_t ProgressTracker::partBytes(int rangeIndex) const {
    if (rangeIndex < 0 || static_cast<std::size_t>(rangeIndex) >= perPart.size())
        return 0;
    return perPart[rangeIndex];
}

std::size_t ProgressTracker::partsReceiving() const {
    return static_cast<std::size_t>(std::count_if(perPart.begin(), perPart.end(),
        [](std::int64_t bytes) { return bytes > 0; }));
}

double ProgressTracker::percent() const {
    return totalBytes <= 0 ? 0.0 : 100.0 * (double)downloadedBytes / (double)totalBytes;
}

double ProgressTracker::elapsedSeconds() const {
    std::chrono::duration<double> elapsed = Clock::now() - started;
    return elapsed.count();
}

double ProgressTracker::megabitsPerSec() const {
    const double seconds = elapsedSeconds();
    return seconds > 0 ? (double)downloadedBytes * 8.0 / 1'000'000.0 / seconds : 0.0;
}

bool ProgressTracker::due(Clock::time_point now, std::chrono::milliseconds interval) {
    if (now - lastReport < interval)
        return false;
    lastReport = now;
    return true;
}

std::string ProgressTracker::line() const {
    std::ostringstream os;
    os << "Progress: "
        << downloadedBytes << "/" << totalBytes << " bytes ("
        << std::fixed << std::setprecision(1) << percent() << "%), "
        << partsReceiving() << "/" << perPart.size() << " parts receiving";
    return os.str();
}
