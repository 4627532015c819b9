#include "Logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
const char* levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Info:  return "INFO ";
    case LogLevel::Warn:  return "WARN ";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO ";
}

std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream os;
    os << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return os.str();
}
}

Logger::Logger(std::ostream& sink)
    : out(sink) {
}

Logger::Logger()
    : out(std::cout) {
}

Logger::~Logger() {
    stop();
}

void Logger::start() {
    if (running.exchange(true))
        return;
    worker = std::thread(&Logger::run, this);
}

void Logger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();

    if (worker.joinable())
        worker.join();
}

void Logger::log(const std::string& msg) {
    log(LogLevel::Info, msg);
}

void Logger::log(LogLevel level, const std::string& msg) {
    std::string line = timestamp() + " [" + levelTag(level) + "] " + msg;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!running.load()) {
            // Not started (or already stopped): write through.
            out << line << std::endl;
            return;
        }
        messages.push(std::move(line));
    }
    cv.notify_one();
}

void Logger::run() {
    std::unique_lock<std::mutex> lock(mtx);
    while (running.load() || !messages.empty()) {
        cv.wait(lock, [&]() {
            return !messages.empty() || !running.load();
            });

        drain(lock);
    }
}

void Logger::drain(std::unique_lock<std::mutex>&) {
    while (!messages.empty()) {
        out << messages.front() << std::endl;
        messages.pop();
    }
}
