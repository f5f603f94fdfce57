// logger.hpp
// Process-wide logger for the Crypto Backtesting Engine
// Thread-safe, iostream based, tagged by sub-system

#pragma once

#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace cryptobt {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "LOG";
}

// Sub-system tags
namespace logtag {
constexpr const char* Backtester = "Backtester";
constexpr const char* Setup      = "Setup";
constexpr const char* Data       = "Data";
constexpr const char* Strategy   = "Strategy";
constexpr const char* Portfolio  = "Portfolio";
constexpr const char* Exchange   = "Exchange";
constexpr const char* Statistics = "Statistics";
constexpr const char* Report     = "Report";
} // namespace logtag

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level_;
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level >= level_;
    }

    // Mirror every line into a file; an empty path closes the current file
    bool setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        if (path.empty()) return true;
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    void log(LogLevel level, const char* subsystem, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (level < level_) return;

        std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
        out << "[" << logLevelName(level) << "] [" << subsystem << "] " << message << std::endl;

        if (file_.is_open()) {
            file_ << "[" << logLevelName(level) << "] [" << subsystem << "] " << message << "\n";
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (file_.is_open()) file_.close();
    }

    mutable std::mutex mtx_;
    LogLevel level_ = LogLevel::Info;
    std::ofstream file_;
};

} // namespace cryptobt

// Stream-style logging: CRYPTOBT_LOG_INFO(logtag::Data, "loaded " << n << " candles")
#define CRYPTOBT_LOG(level, subsystem, expr)                                   \
    do {                                                                       \
        if (::cryptobt::Logger::instance().enabled(level)) {                   \
            std::ostringstream cryptobt_log_stream_;                           \
            cryptobt_log_stream_ << expr;                                      \
            ::cryptobt::Logger::instance().log(level, subsystem,               \
                                               cryptobt_log_stream_.str());    \
        }                                                                      \
    } while (0)

#define CRYPTOBT_LOG_DEBUG(subsystem, expr) CRYPTOBT_LOG(::cryptobt::LogLevel::Debug, subsystem, expr)
#define CRYPTOBT_LOG_INFO(subsystem, expr)  CRYPTOBT_LOG(::cryptobt::LogLevel::Info, subsystem, expr)
#define CRYPTOBT_LOG_WARN(subsystem, expr)  CRYPTOBT_LOG(::cryptobt::LogLevel::Warn, subsystem, expr)
#define CRYPTOBT_LOG_ERROR(subsystem, expr) CRYPTOBT_LOG(::cryptobt::LogLevel::Error, subsystem, expr)
