#include "Logger.h"

namespace {
const char* prefixFor(Logger::Level level) {
    switch (level) {
    case Logger::Level::Warn: return "[spd] warning: ";
    case Logger::Level::Error: return "[spd] error: ";
    default: return "[spd] ";
    }
}
}

Logger::Logger(std::ostream& sink)
    : out(sink) {
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

    // Messages logged while the worker was not running
    std::lock_guard<std::mutex> lock(mtx);
    while (!messages.empty()) {
        out << messages.front() << std::endl;
        messages.pop();
    }
}

void Logger::log(Level level, const std::string& msg) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        messages.push(prefixFor(level) + msg);
    }
    cv.notify_one();
}

void Logger::run() {
    std::unique_lock<std::mutex> lock(mtx);
    while (true) {
        cv.wait(lock, [&]() {
            return !messages.empty() || !running.load();
            });

        while (!messages.empty()) {
            std::string line = std::move(messages.front());
            messages.pop();

            lock.unlock();
            out << line << std::endl;
            lock.lock();
        }

        if (!running.load())
            return;
    }
}
