#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace StemPrep {

enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

// Process-wide logger for progress and diagnostic messages.
// Every line is prefixed with a local timestamp ("YYYY-mm-dd HH:MM:SS.mmm - ").
// Error/Warn go to stderr, Info/Debug to stdout; an optional log file
// receives every line that passes the level filter.
class Logger {
public:
    // Get the singleton instance
    static Logger& getInstance();

    void setLevel(LogLevel level);
    LogLevel getLevel() const;

    // Append log lines to a file as well as the console. Empty path closes it.
    // Returns false if the file could not be opened.
    bool setLogFile(const std::string& path);

    bool isEnabled(LogLevel level) const;

    // Log a message (thread-safe)
    void log(LogLevel level, const std::string& msg);

private:
    Logger();
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    LogLevel level_;
    std::unique_ptr<std::ofstream> logFile_;
};

// Current local time formatted as "YYYY-mm-dd HH:MM:SS.mmm"
std::string currentTimestamp();

inline void logError(const std::string& msg) { Logger::getInstance().log(LogLevel::Error, msg); }
inline void logWarn(const std::string& msg) { Logger::getInstance().log(LogLevel::Warn, msg); }
inline void logInfo(const std::string& msg) { Logger::getInstance().log(LogLevel::Info, msg); }
inline void logDebug(const std::string& msg) { Logger::getInstance().log(LogLevel::Debug, msg); }

} // namespace StemPrep
