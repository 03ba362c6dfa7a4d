#include "ReportChannel.h"

void ReportChannel::push(WorkerReport report) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        reports.push(std::move(report));
    }
    cv.notify_one();
}

std::size_t ReportChannel::drainFor(std::chrono::milliseconds timeout, const Handler& handler) {
    std::queue<WorkerReport> batch;
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait_for(lock, timeout, [&]() { return !reports.empty(); });
        batch.swap(reports);
    }

    const std::size_t handled = batch.size();
    while (!batch.empty()) {
        handler(batch.front());
        batch.pop();
    }
    return handled;
}
