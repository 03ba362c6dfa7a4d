#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <utility>

class CancellationToken;

// Buffer size for part writes and merge copies
constexpr std::size_t kChunkSize = 4096;
constexpr int kDefaultWorkerCount = 4;

struct DownloadJob {
    std::string url;
    std::string outputPath;

    int workerCount = kDefaultWorkerCount;

    std::optional<std::string> proxy;
    std::vector<std::string> headers; // "Name: value"

    const CancellationToken* cancellation = nullptr;
};

struct RangeSpec {
    int index;
    std::int64_t start;
    std::int64_t end; // inclusive

    std::int64_t length() const { return end - start + 1; }
};

enum class ErrorKind {
    None,
    InvalidConfiguration,
    UnsupportedSource,
    TransportError,
    IOError,
    MissingPart,
    Cancelled
};

const char* toString(ErrorKind kind);

struct Status {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    static Status success() { return {}; }
    static Status failure(ErrorKind kind, std::string message) {
        return { kind, std::move(message) };
    }
};

enum class DownloadState {
    Init,
    SizeQuery,
    Planning,
    Fetching,
    Merging,
    Done,
    Failed
};

struct DownloadResult {
    Status status;
    std::int64_t bytesTransferred = 0;
    std::string outputPath;

    bool ok() const { return status.ok(); }
};

enum class RangeState {
    Pending,
    InProgress,
    Done,
    Failed
};

struct WorkerReport {
    enum class Type { Progress, Finished };

    Type type;
    int rangeIndex;
    std::int64_t bytes;
    Status status;
};

std::string partFilePath(const std::string& outputPath, std::int64_t rangeStart);
