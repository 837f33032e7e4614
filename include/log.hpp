// log.hpp
#pragma once
#include <sstream>
#include <string>

enum class LogLevel { Debug = 0, Info, Warn, Error };

void setLogLevel(LogLevel level);
LogLevel logLevel();
bool parseLogLevel(const std::string& name, LogLevel& out);

// One line per call; safe to call from any thread.
void logLine(LogLevel level, const char* tag, const std::string& message);

#define PF_LOG(level, tag, expr)                                  \
    do {                                                          \
        if (static_cast<int>(level) >= static_cast<int>(logLevel())) { \
            std::ostringstream pf_os_;                            \
            pf_os_ << expr;                                       \
            logLine(level, tag, pf_os_.str());                    \
        }                                                         \
    } while (0)

#define PF_LOG_DEBUG(tag, expr) PF_LOG(LogLevel::Debug, tag, expr)
#define PF_LOG_INFO(tag, expr)  PF_LOG(LogLevel::Info,  tag, expr)
#define PF_LOG_WARN(tag, expr)  PF_LOG(LogLevel::Warn,  tag, expr)
#define PF_LOG_ERROR(tag, expr) PF_LOG(LogLevel::Error, tag, expr)
