#pragma once
#include <cstdint>
#include <functional>

#include "utils.h"
#include "CancellationToken.h"
#include "../net/HttpClient.h"

// Downloads one range into its own part file, resuming from whatever prefix
// is already on disk. A part left by a failed or cancelled fetch is kept.
class PartFetcher {
public:
    using ProgressCallback = std::function<void(std::int64_t)>;

    PartFetcher(HttpClient& client, const CancellationToken& cancel);

    Status fetch(const DownloadJob& job,
        const RangeSpec& range,
        const ProgressCallback& onProgress);

private:
    bool cancelled(const DownloadJob& job) const;

private:
    HttpClient& client;
    const CancellationToken& cancelToken;
};
