#pragma once
#include <queue>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <functional>
#include <cstddef>

#include "../core/utils.h"

// Many fetch threads push, the coordinator thread alone drains.
class ReportChannel {
public:
    using Handler = std::function<void(const WorkerReport&)>;

    void push(WorkerReport report);

    // Waits up to timeout for reports and hands every queued one to handler.
    // Returns the number of reports handled.
    std::size_t drainFor(std::chrono::milliseconds timeout, const Handler& handler);

private:
    std::queue<WorkerReport> reports;
    std::mutex mtx;
    std::condition_variable cv;
};
