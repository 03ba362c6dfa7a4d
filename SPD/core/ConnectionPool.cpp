#include "ConnectionPool.h"

ConnectionPool::ConnectionPool(const DownloadJob& j, ClientFactory f, std::size_t maxSize)
    : job(j), factory(std::move(f)), maxPoolSize(maxSize) {
}

std::unique_ptr<HttpClient> ConnectionPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mtx);

        if (!pool.empty()) {
            auto client = std::move(pool.front());
            pool.pop();
            return client;
        }
    }

    return factory(job);
}

void ConnectionPool::release(std::unique_ptr<HttpClient> client) {
    if (!client)
        return;

    std::lock_guard<std::mutex> lock(mtx);

    if (pool.size() < maxPoolSize) {
        pool.push(std::move(client));
    }
}
