// log.cpp
#include "log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace {
std::mutex g_logMutex;
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}
}

void setLogLevel(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel logLevel() { return static_cast<LogLevel>(g_level.load()); }

bool parseLogLevel(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info")  { out = LogLevel::Info;  return true; }
    if (name == "warn")  { out = LogLevel::Warn;  return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    return false;
}

void logLine(LogLevel level, const char* tag, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);

    std::lock_guard<std::mutex> lock(g_logMutex);
    std::ostream& os = (level == LogLevel::Error) ? std::cerr : std::cout;
    os << '[' << std::put_time(&tm, "%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << ms << std::setfill(' ')
       << "][" << levelName(level) << "][" << tag << "] " << message << std::endl;
}
