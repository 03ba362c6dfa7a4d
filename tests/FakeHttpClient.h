#pragma once
#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "net/HttpClient.h"
#include "core/utils.h"

// In-memory resource served over the HttpClient interface
struct FakeSource {
    std::vector<char> data;
    bool acceptRanges = true;
    bool ignoresRanges = false; // advertises ranges but answers 200
    bool reportLength = true;
    bool headFails = false;

    std::size_t pieceSize = 1024;

    // When it returns true for a request start, the transfer breaks after failAfterBytes
    std::function<bool(std::int64_t)> failRange;
    std::int64_t failAfterBytes = 0;

    std::int64_t extraBytes = 0; // sent beyond the requested end
    std::int64_t shortBy = 0;    // withheld from the end of every response

    // Called before every piece is delivered, from the fetching thread
    std::function<void()> beforePiece;

    std::atomic<int> headCalls{ 0 };
    std::atomic<int> clientsCreated{ 0 };
    std::atomic<int> activeTransfers{ 0 };

    std::vector<std::pair<std::int64_t, std::int64_t>> requests() const {
        std::lock_guard<std::mutex> lock(mtx);
        return requestLog;
    }

    void clearRequests() {
        std::lock_guard<std::mutex> lock(mtx);
        requestLog.clear();
    }

    void record(std::int64_t start, std::int64_t end) {
        std::lock_guard<std::mutex> lock(mtx);
        requestLog.emplace_back(start, end);
    }

private:
    mutable std::mutex mtx;
    std::vector<std::pair<std::int64_t, std::int64_t>> requestLog;
};

class FakeHttpClient : public HttpClient {
    struct ActiveTransfer {
        explicit ActiveTransfer(std::atomic<int>& c) : counter(c) { ++counter; }
        ~ActiveTransfer() { --counter; }
        std::atomic<int>& counter;
    };

public:
    explicit FakeHttpClient(std::shared_ptr<FakeSource> src)
        : source(std::move(src)) {
        ++source->clientsCreated;
    }

    bool head(HttpHeadResult& out) override {
        ++source->headCalls;
        if (source->headFails) {
            error = "connection refused";
            return false;
        }
        out.contentLength = source->reportLength ? static_cast<std::int64_t>(source->data.size()) : -1;
        out.acceptRanges = source->acceptRanges;
        return true;
    }

    bool getRange(std::int64_t start, std::int64_t end, const DataCallback& onData) override {
        source->record(start, end);
        ActiveTransfer active(source->activeTransfers);
        const auto size = static_cast<std::int64_t>(source->data.size());

        if (start < 0 || start > end || end >= size) {
            error = "HTTP status 416";
            return false;
        }

        // A server that ignores Range answers 200 with the whole resource
        const long status = (source->acceptRanges && !source->ignoresRanges) ? 206 : 200;
        if (!rangeResponseAccepted(status, start)) {
            error = "HTTP status " + std::to_string(status) + " does not match range";
            return false;
        }

        std::int64_t first = start;
        std::int64_t last = std::min(end + source->extraBytes, size - 1) - source->shortBy;
        if (status == 200) {
            first = 0;
            last = size - 1;
        }

        bool failing = source->failRange && source->failRange(start);
        if (failing)
            last = std::min(last, first + source->failAfterBytes - 1);

        std::int64_t pos = first;
        while (pos <= last) {
            if (source->beforePiece)
                source->beforePiece();

            const std::int64_t n = std::min<std::int64_t>(static_cast<std::int64_t>(source->pieceSize), last - pos + 1);
            if (!onData(source->data.data() + pos, static_cast<std::size_t>(n))) {
                error = "transfer aborted by receiver";
                return false;
            }
            pos += n;
        }

        if (failing) {
            error = "connection reset by peer";
            return false;
        }
        return true;
    }

    std::string lastError() const override { return error; }

private:
    std::shared_ptr<FakeSource> source;
    std::string error;
};

inline std::function<std::unique_ptr<HttpClient>(const DownloadJob&)> fakeFactory(std::shared_ptr<FakeSource> source) {
    return [source](const DownloadJob&) -> std::unique_ptr<HttpClient> {
        return std::make_unique<FakeHttpClient>(source);
    };
}
