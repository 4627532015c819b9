#include "ConnectionPool.h"

ConnectionPool::ConnectionPool(Factory factory, std::size_t maxSize)
    : makeClient(std::move(factory)), maxPoolSize(maxSize) {
}

std::unique_ptr<Fetcher> ConnectionPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mtx);

        if (!pool.empty()) {
            auto client = std::move(pool.front());
            pool.pop();
            return client;
        }
    }

    return makeClient();
}

void ConnectionPool::release(std::unique_ptr<Fetcher> client) {
    if (!client)
        return;

    std::lock_guard<std::mutex> lock(mtx);

    if (pool.size() < maxPoolSize) {
        pool.push(std::move(client));
    }
}

std::size_t ConnectionPool::idle() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pool.size();
}
