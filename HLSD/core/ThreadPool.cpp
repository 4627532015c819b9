#include "ThreadPool.h"

ThreadPool::ThreadPool(std::atomic<bool>& stopFlag)
    : shouldStop(stopFlag) {
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::start(std::size_t n, WorkerFn worker) {
    std::lock_guard<std::mutex> lock(mtx);

    for (std::size_t i = 0; i < n; ++i) {
        running.fetch_add(1);
        threads.emplace_back([this, worker]() {
            worker();
            running.fetch_sub(1);
            });
    }
}

void ThreadPool::join() {
    std::lock_guard<std::mutex> lock(mtx);

    for (auto& t : threads) {
        if (t.joinable())
            t.join();
    }

    threads.clear();
}

void ThreadPool::shutdown() {
    shouldStop.store(true);
    join();
}

std::size_t ThreadPool::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return threads.size();
}

std::size_t ThreadPool::active() const {
    return running.load();
}
