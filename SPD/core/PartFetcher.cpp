#include "PartFetcher.h"
#include "../io/PartFile.h"

#include <algorithm>

PartFetcher::PartFetcher(HttpClient& httpClient, const CancellationToken& cancel)
    : client(httpClient),
    cancelToken(cancel) {
}

bool PartFetcher::cancelled(const DownloadJob& job) const {
    if (cancelToken.isCancelled())
        return true;
    return job.cancellation && job.cancellation->isCancelled();
}

Status PartFetcher::fetch(const DownloadJob& job,
    const RangeSpec& range,
    const ProgressCallback& onProgress) {
    const std::int64_t span = range.length();
    if (range.start < 0 || span <= 0) {
        return Status::failure(ErrorKind::InvalidConfiguration,
            "invalid range " + std::to_string(range.start) + "-" + std::to_string(range.end));
    }

    if (cancelled(job))
        return Status::failure(ErrorKind::Cancelled, "cancelled before range " + std::to_string(range.index) + " started");

    PartFile part(partFilePath(job.outputPath, range.start));

    // An existing prefix no longer than the range is resumable
    const std::int64_t existing = PartFile::existingSize(part.path());
    const bool resume = existing > 0 && existing <= span;
    if (resume && existing == span)
        return Status::success();

    const std::int64_t offset = resume ? existing : 0;
    const std::int64_t remaining = span - offset;

    if (!part.open(resume))
        return Status::failure(ErrorKind::IOError, "cannot open part file " + part.path());

    std::int64_t written = 0;
    Status failure;

    bool ok = client.getRange(
        range.start + offset,
        range.end,
        [&](const char* data, std::size_t size) {
            while (size > 0) {
                if (cancelled(job)) {
                    failure = Status::failure(ErrorKind::Cancelled, "range " + std::to_string(range.index) + " cancelled");
                    return false;
                }

                const std::size_t piece = std::min(size, kChunkSize);
                if (written + static_cast<std::int64_t>(piece) > remaining) {
                    failure = Status::failure(ErrorKind::TransportError,
                        "server sent more than " + std::to_string(remaining) + " bytes for range " + std::to_string(range.index));
                    return false;
                }

                if (!part.write(data, piece)) {
                    failure = Status::failure(ErrorKind::IOError, "write to " + part.path() + " failed");
                    return false;
                }

                // Bytes are in the part file (kernel side) before they are reported
                written += static_cast<std::int64_t>(piece);
                if (onProgress)
                    onProgress(static_cast<std::int64_t>(piece));

                data += piece;
                size -= piece;

                if (written < remaining && cancelled(job)) {
                    failure = Status::failure(ErrorKind::Cancelled, "range " + std::to_string(range.index) + " cancelled");
                    return false;
                }
            }
            return true;
        });

    // A prefix kept for a later resume is synced as well
    const bool synced = written == 0 || part.flush();

    if (!failure.ok())
        return failure;

    if (!ok)
        return Status::failure(ErrorKind::TransportError, client.lastError());

    if (written != remaining) {
        return Status::failure(ErrorKind::TransportError,
            "range " + std::to_string(range.index) + " ended after " + std::to_string(written) +
            " of " + std::to_string(remaining) + " bytes");
    }

    if (!synced)
        return Status::failure(ErrorKind::IOError, "flush of " + part.path() + " failed");

    return Status::success();
}
