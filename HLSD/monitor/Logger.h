#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <ostream>

enum class LogLevel {
    Info,
    Warn,
    Error
};

// Asynchronous line logger: callers enqueue, a background thread writes.
class Logger {
public:
    explicit Logger(std::ostream& sink);
    Logger();
    ~Logger();

    void start();
    void stop();

    void log(const std::string& msg);
    void log(LogLevel level, const std::string& msg);
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

private:
    void run();
    void drain(std::unique_lock<std::mutex>& lock);

private:
    std::ostream& out;
    std::queue<std::string> messages;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{ false };
    std::thread worker;
};
