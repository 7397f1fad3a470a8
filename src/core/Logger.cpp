#include "handcad/core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sys/stat.h>
#include <sys/types.h>

namespace handcad {
namespace core {

namespace {

bool ensureDirectory(const std::string& directory) {
    struct stat st;
    if (stat(directory.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            return true;
        }
        std::cerr << "[Logger] " << directory << " is not a directory" << std::endl;
        return false;
    }

    if (mkdir(directory.c_str(), 0755) == 0 || errno == EEXIST) {
        return true;
    }

    if (errno == ENOENT) {
        const size_t slash = directory.find_last_of('/');
        if (slash != std::string::npos && slash > 0 &&
            ensureDirectory(directory.substr(0, slash))) {
            return mkdir(directory.c_str(), 0755) == 0 || errno == EEXIST;
        }
    }

    std::cerr << "[Logger] Cannot create " << directory << ": " << std::strerror(errno) << std::endl;
    return false;
}

std::string localTime(const char* format,
                      std::chrono::system_clock::time_point when = std::chrono::system_clock::now()) {
    const auto time_t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

} // namespace

LogLevel logLevelFromString(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

Logger::~Logger() {
    closeLogFile();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleOutput_ = enable;
}

bool Logger::configure(const LoggingConfig& config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        minLevel_ = config.level;
        consoleOutput_ = config.console;
    }

    if (config.file.empty()) {
        closeLogFile();
        return true;
    }
    if (config.file == "auto") {
        return openTimestampedLog(config.directory);
    }
    return setLogFile(config.file);
}

bool Logger::openFileLocked(const std::string& filename) {
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();

    logFile_.open(filename, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[Logger] Failed to open " << filename << ": " << std::strerror(errno) << std::endl;
        return false;
    }
    currentLogFile_ = filename;
    return true;
}

bool Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    return openFileLocked(filename);
}

bool Logger::openTimestampedLog(const std::string& directory) {
    if (!ensureDirectory(directory)) {
        return false;
    }

    std::string path = directory;
    if (path.back() != '/') {
        path += '/';
    }
    path += "log_handcad_" + localTime("%Y-%m-%d_%H-%M-%S") + ".txt";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!openFileLocked(path)) {
        return false;
    }

    logFile_ << "# HandCAD session log, started " << getTimestamp()
             << ", level " << logLevelToString(minLevel_) << std::endl;
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLogFile_;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    if (logFile_.is_open()) {
        logFile_.flush();
    }
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& file, int line) {
    if (level < minLevel_) {
        return;
    }

    const std::string formatted = formatMessage(level, component, message, file, line);

    std::lock_guard<std::mutex> lock(mutex_);
    counts_[static_cast<size_t>(level)]++;

    if (consoleOutput_) {
        (level >= LogLevel::ERROR ? std::cerr : std::cout) << formatted << '\n';
    }
    if (logFile_.is_open()) {
        logFile_ << formatted << '\n';
        if (level >= LogLevel::ERROR) {
            logFile_.flush();
        }
    }
}

std::uint64_t Logger::getMessageCount(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_[static_cast<size_t>(level)];
}

void Logger::resetCounters() {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_.fill(0);
}

std::string Logger::getTimestamp() const {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << localTime("%Y-%m-%d %H:%M:%S", now)
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::formatMessage(LogLevel level, const std::string& component,
                                  const std::string& message,
                                  const std::string& file, int line) const {
    std::ostringstream oss;
    oss << "[" << getTimestamp() << "] [" << logLevelToString(level) << "] ";
    if (!component.empty()) {
        oss << "[" << component << "] ";
    }
    oss << message;

    if (!file.empty() && line > 0) {
        const size_t pos = file.find_last_of("/\\");
        oss << " (" << (pos != std::string::npos ? file.substr(pos + 1) : file) << ":" << line << ")";
    }
    return oss.str();
}

} // namespace core
} // namespace handcad
