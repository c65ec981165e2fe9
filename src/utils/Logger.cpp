#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace StemPrep {

std::string currentTimestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm_buf;
#if defined(_WIN32)
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : level_(LogLevel::Info) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_) {
        logFile_->flush();
        logFile_->close();
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::getLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_) {
        logFile_->close();
        logFile_.reset();
    }
    if (path.empty()) {
        return true;
    }

    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!file->is_open()) {
        return false;
    }
    logFile_ = std::move(file);
    return true;
}

bool Logger::isEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) <= static_cast<int>(level_);
}

void Logger::log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) > static_cast<int>(level_)) {
        return;
    }

    std::string line = currentTimestamp() + " - ";
    if (level == LogLevel::Error) {
        line += "ERROR: ";
    } else if (level == LogLevel::Warn) {
        line += "WARNING: ";
    }
    line += msg;

    if (level == LogLevel::Error || level == LogLevel::Warn) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }

    if (logFile_ && logFile_->is_open()) {
        *logFile_ << line << std::endl;
    }
}

} // namespace StemPrep
