#pragma once
#include <vector>
#include <thread>
#include <functional>
#include <mutex>

// Fixed set of threads running one worker function; shutdown() is the join barrier.
class ThreadPool {
public:
    using WorkerFn = std::function<void()>;

    ThreadPool() = default;
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void start(std::size_t n, const WorkerFn& worker);
    void shutdown();

private:
    std::vector<std::thread> threads;
    std::mutex mtx;
};
