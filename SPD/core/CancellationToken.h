#pragma once
#include <atomic>

class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(const CancellationToken* parentToken)
        : parent(parentToken) {
    }

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { flag.store(true, std::memory_order_relaxed); }

    bool isCancelled() const {
        if (flag.load(std::memory_order_relaxed))
            return true;
        return parent && parent->isCancelled();
    }

private:
    std::atomic<bool> flag{ false };
    const CancellationToken* parent{ nullptr };
};
