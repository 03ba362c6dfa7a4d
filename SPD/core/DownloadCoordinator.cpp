#include "DownloadCoordinator.h"
#include "PartFetcher.h"
#include "RangePlanner.h"
#include "../io/PartMerger.h"
#include "../net/CurlHttpClient.h"

#include <chrono>
#include <sstream>
#include <iomanip>
#include <algorithm>

DownloadCoordinator::DownloadCoordinator(const DownloadJob& j,
    ClientFactory factory,
    volatile std::sig_atomic_t* externalStop,
    std::ostream& logSink)
    : job(j),
    clientFactory(std::move(factory)),
    externalStopSignal(externalStop),
    cancelToken(j.cancellation),
    logger(logSink)
{
}

DownloadCoordinator::DownloadCoordinator(const DownloadJob& j, volatile std::sig_atomic_t* externalStop)
    : DownloadCoordinator(j, &CurlHttpClient::fromJob, externalStop)
{
}

DownloadCoordinator::~DownloadCoordinator() {
    // run() left early (an exception from onProgress or thread creation)
    cancelToken.cancel();
    if (threadPool)
        threadPool->shutdown();
}

DownloadResult DownloadCoordinator::run(const ProgressCallback& onProgress) {
    logger.start();

    if (job.url.empty() || job.outputPath.empty())
        return finish(Status::failure(ErrorKind::InvalidConfiguration, "source url and destination path are required"));

    connectionPool = std::make_unique<ConnectionPool>(
        job, clientFactory, static_cast<std::size_t>(std::max(job.workerCount, 1)));

    currentState.store(DownloadState::SizeQuery);
    HttpHeadResult head{};
    Status status = querySize(head);
    if (!status.ok())
        return finish(status);

    currentState.store(DownloadState::Planning);
    int workers = job.workerCount;
    if (!head.acceptRanges && workers > 1) {
        logger.warn("Server does not advertise byte ranges, using a single connection");
        workers = 1;
    }

    auto planned = RangePlanner::plan(head.contentLength, workers);
    if (!planned) {
        return finish(Status::failure(ErrorKind::InvalidConfiguration,
            "cannot split " + std::to_string(head.contentLength) + " bytes across " +
            std::to_string(job.workerCount) + " workers"));
    }
    ranges = std::move(*planned);

    logger.log("Size " + std::to_string(head.contentLength) + " bytes, " +
        std::to_string(ranges.size()) + " parts");

    currentState.store(DownloadState::Fetching);
    progress.begin(head.contentLength, ranges);

    status = fetchAll(onProgress);
    if (!status.ok())
        return finish(status);

    currentState.store(DownloadState::Merging);
    PartMerger merger;
    status = merger.merge(job.outputPath, ranges);
    if (!status.ok())
        return finish(status);

    currentState.store(DownloadState::Done);
    return finish(Status::success(), merger.bytesMerged());
}

Status DownloadCoordinator::querySize(HttpHeadResult& head) {
    auto client = connectionPool->acquire();
    if (!client)
        return Status::failure(ErrorKind::TransportError, "cannot create HTTP client for " + job.url);

    if (!client->head(head))
        return Status::failure(ErrorKind::TransportError, "size query failed: " + client->lastError());

    connectionPool->release(std::move(client));

    if (head.contentLength < 0)
        return Status::failure(ErrorKind::UnsupportedSource, job.url + " does not report its length");

    return Status::success();
}

Status DownloadCoordinator::fetchAll(const ProgressCallback& onProgress) {
    if (ranges.empty())
        return Status::success();

    rangeQueue = std::make_unique<RangeQueue>(ranges);
    threadPool = std::make_unique<ThreadPool>();
    finishedParts = 0;
    firstError = Status::success();

    spawnWorkers();

    // Every range reports Finished exactly once, cancelled or not
    while (finishedParts < ranges.size()) {
        if (externalStopSignal && *externalStopSignal != 0)
            cancelToken.cancel();

        channel.drainFor(std::chrono::milliseconds(50), [&](const WorkerReport& rep) {
            onWorkerReport(rep, onProgress);
            });

        if (progress.due(ProgressTracker::Clock::now()))
            logger.log(progress.line());
    }

    threadPool->shutdown();

    const bool cancelled = cancelToken.isCancelled();
    logSummary(firstError.ok() && !cancelled);

    if (!firstError.ok())
        return firstError;
    if (cancelled)
        return Status::failure(ErrorKind::Cancelled, "download cancelled");
    return Status::success();
}

void DownloadCoordinator::spawnWorkers() {
    auto workerFn = [this]() {
        while (auto next = rangeQueue->getNext()) {
            const RangeSpec range = *next;

            Status status;
            auto client = connectionPool->acquire();
            if (!client) {
                status = Status::failure(ErrorKind::TransportError, "cannot create HTTP client for " + job.url);
            }
            else {
                PartFetcher fetcher(*client, cancelToken);
                status = fetcher.fetch(job, range, [&](std::int64_t delta) {
                    channel.push({ WorkerReport::Type::Progress, range.index, delta, {} });
                    });
                connectionPool->release(std::move(client));
            }

            if (status.ok())
                rangeQueue->markDone(range.index);
            else
                rangeQueue->markFailed(range.index);

            channel.push({ WorkerReport::Type::Finished, range.index, 0, std::move(status) });
        }
        };

    threadPool->start(ranges.size(), workerFn);
}

void DownloadCoordinator::onWorkerReport(const WorkerReport& report, const ProgressCallback& onProgress) {
    if (report.type == WorkerReport::Type::Progress) {
        progress.add(report.rangeIndex, report.bytes);
        if (onProgress)
            onProgress(report.bytes);
        return;
    }

    ++finishedParts;
    if (report.status.ok())
        return;

    if (firstError.ok())
        firstError = report.status;

    const std::string line = "Part " + std::to_string(report.rangeIndex) + " " +
        toString(report.status.kind) + " after " + std::to_string(progress.partBytes(report.rangeIndex)) +
        " new bytes: " + report.status.message;
    if (report.status.kind == ErrorKind::Cancelled)
        logger.warn(line);
    else
        logger.error(line);
}

void DownloadCoordinator::logSummary(bool success) {
    std::ostringstream conclusion;
    conclusion << "Fetch "
        << (success ? "completed" : "stopped")
        << " in " << std::fixed << std::setprecision(2) << progress.elapsedSeconds()
        << "s, avg speed " << progress.megabitsPerSec()
        << " Mbps, parts " << rangeQueue->countIn(RangeState::Done) << "/" << ranges.size();

    if (!firstError.ok())
        conclusion << " (first error: " << toString(firstError.kind) << ": " << firstError.message << ")";

    logger.log(conclusion.str());
}

DownloadResult DownloadCoordinator::finish(Status status, std::int64_t bytes) {
    if (!status.ok()) {
        currentState.store(DownloadState::Failed);
        logger.error(std::string(toString(status.kind)) + ": " + status.message);
    }
    else {
        logger.log("Saved " + std::to_string(bytes) + " bytes to " + job.outputPath);
    }

    logger.stop();

    DownloadResult result;
    result.status = std::move(status);
    result.bytesTransferred = bytes;
    result.outputPath = job.outputPath;
    return result;
}
