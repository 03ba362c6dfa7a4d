#pragma once
#include <string>
#include <functional>
#include <cstdint>
#include <cstddef>

struct HttpHeadResult {
    std::int64_t contentLength = -1; // -1 when the server does not report it
    bool acceptRanges = false;
};

// Whether a response to a ranged GET starting at requestStart may be written.
// 206 is the range itself; 200 carries the whole resource, which is only the
// requested bytes when the request starts at offset 0.
bool rangeResponseAccepted(long status, std::int64_t requestStart);

class HttpClient {
public:
    using DataCallback = std::function<bool(const char*, std::size_t)>;

    virtual ~HttpClient() = default;

    virtual bool head(HttpHeadResult& out) = 0;

    // Inclusive [start, end]. Returning false from onData aborts the transfer.
    // onData is never called for a response rangeResponseAccepted rejects.
    virtual bool getRange(std::int64_t start,
        std::int64_t end,
        const DataCallback& onData) = 0;

    virtual std::string lastError() const = 0;
};
