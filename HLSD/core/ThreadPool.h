#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <functional>
#include <mutex>

class ThreadPool {
public:
    using WorkerFn = std::function<void()>;

    explicit ThreadPool(std::atomic<bool>& stopFlag);
    ~ThreadPool();

    void start(std::size_t n, WorkerFn worker);

    // Waits for the workers to return on their own.
    void join();
    // Raises the stop flag, then joins.
    void shutdown();

    std::size_t size() const;
    std::size_t active() const;

private:
    std::vector<std::thread> threads;
    std::atomic<bool>& shouldStop;
    std::atomic<std::size_t> running{ 0 };
    mutable std::mutex mtx;
};
