#pragma once
#include <queue>
#include <cstddef>
#include <memory>
#include <mutex>
#include <functional>

#include "../net/Fetcher.h"

class ConnectionPool {
public:
    using Factory = std::function<std::unique_ptr<Fetcher>()>;

    ConnectionPool(Factory factory, std::size_t maxSize);

    std::unique_ptr<Fetcher> acquire();
    void release(std::unique_ptr<Fetcher> client);

    std::size_t idle() const;

private:
    Factory makeClient;
    std::size_t maxPoolSize;
    std::queue<std::unique_ptr<Fetcher>> pool;
    mutable std::mutex mtx;
};
