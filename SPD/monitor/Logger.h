#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <iostream>

class Logger {
public:
    enum class Level { Info, Warn, Error };

    explicit Logger(std::ostream& sink = std::cout);
    ~Logger();

    void start();
    void stop();

    void log(const std::string& msg) { log(Level::Info, msg); }
    void warn(const std::string& msg) { log(Level::Warn, msg); }
    void error(const std::string& msg) { log(Level::Error, msg); }
    void log(Level level, const std::string& msg);

private:
    void run();

private:
    std::ostream& out;
    std::queue<std::string> messages;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{ false };
    std::thread worker;
};
