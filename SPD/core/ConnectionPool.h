#pragma once
#include <queue>
#include <memory>
#include <mutex>
#include <functional>

#include "utils.h"
#include "../net/HttpClient.h"

class ConnectionPool {
public:
    using ClientFactory = std::function<std::unique_ptr<HttpClient>(const DownloadJob&)>;

    ConnectionPool(const DownloadJob& job, ClientFactory factory, std::size_t maxSize);

    // Returns nullptr only when the factory cannot create a client
    std::unique_ptr<HttpClient> acquire();
    void release(std::unique_ptr<HttpClient> client);

private:
    const DownloadJob& job;
    ClientFactory factory;
    std::size_t maxPoolSize;
    std::queue<std::unique_ptr<HttpClient>> pool;
    std::mutex mtx;
};
