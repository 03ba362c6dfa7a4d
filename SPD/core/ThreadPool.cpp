#include "ThreadPool.h"

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::start(std::size_t n, const WorkerFn& worker) {
    std::lock_guard<std::mutex> lock(mtx);

    threads.reserve(threads.size() + n);
    for (std::size_t i = 0; i < n; ++i) {
        threads.emplace_back(worker);
    }
}

void ThreadPool::shutdown() {
    std::vector<std::thread> joining;
    {
        std::lock_guard<std::mutex> lock(mtx);
        joining.swap(threads);
    }

    for (auto& t : joining) {
        if (t.joinable())
            t.join();
    }
}
