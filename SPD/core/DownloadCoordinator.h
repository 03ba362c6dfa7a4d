#pragma once
#include <atomic>
#include <memory>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <csignal>
#include <functional>
#include <iostream>

#include "utils.h"
#include "CancellationToken.h"
#include "RangeQueue.h"
#include "ThreadPool.h"
#include "ConnectionPool.h"
#include "../net/HttpClient.h"
#include "../monitor/ProgressTracker.h"
#include "../monitor/ReportChannel.h"
#include "../monitor/Logger.h"

// Runs one job: size query, planning, one concurrent fetch per range, then an
// ordered merge. A failed or cancelled part never triggers the merge; parts
// already in flight are allowed to finish and every part file stays on disk.
class DownloadCoordinator {
public:
    using ProgressCallback = std::function<void(std::int64_t)>;
    using ClientFactory = ConnectionPool::ClientFactory;

    DownloadCoordinator(const DownloadJob& job,
        ClientFactory factory,
        volatile std::sig_atomic_t* externalStop = nullptr,
        std::ostream& logSink = std::cout);
    explicit DownloadCoordinator(const DownloadJob& job, volatile std::sig_atomic_t* externalStop = nullptr);
    ~DownloadCoordinator();

    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    // onProgress receives byte deltas, always from the calling thread
    DownloadResult run(const ProgressCallback& onProgress = {});

    DownloadState state() const { return currentState.load(); }

private:
    Status querySize(HttpHeadResult& head);
    Status fetchAll(const ProgressCallback& onProgress);
    void spawnWorkers();
    void onWorkerReport(const WorkerReport& report, const ProgressCallback& onProgress);
    void logSummary(bool success);
    DownloadResult finish(Status status, std::int64_t bytes = 0);

private:
    const DownloadJob& job;
    ClientFactory clientFactory;
    volatile std::sig_atomic_t* externalStopSignal{ nullptr };

    CancellationToken cancelToken;
    std::atomic<DownloadState> currentState{ DownloadState::Init };

    std::vector<RangeSpec> ranges;
    std::unique_ptr<RangeQueue> rangeQueue;
    std::unique_ptr<ConnectionPool> connectionPool;

    ReportChannel channel;
    ProgressTracker progress;
    Logger logger;

    std::size_t finishedParts{ 0 };
    Status firstError;

    // Declared last: workers use every member above, so they are joined first
    std::unique_ptr<ThreadPool> threadPool;
};
