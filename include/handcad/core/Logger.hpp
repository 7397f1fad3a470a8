#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <sstream>
#include <mutex>
#include <fstream>

namespace handcad {
namespace core {

class Configuration;

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Parse a level name ("TRACE" ... "CRITICAL", case-insensitive).
 * Unknown names map to INFO.
 */
LogLevel logLevelFromString(const std::string& name);

std::string logLevelToString(LogLevel level);

/**
 * Logging section of the runtime configuration
 *
 * file: empty for console only, "auto" for a timestamped file under
 * directory, anything else is a path opened in append mode.
 */
struct LoggingConfig {
    LogLevel level = LogLevel::INFO;
    bool console = true;
    std::string file;
    std::string directory = "/tmp/handcad/log";

    bool is_valid() const {
        return file != "auto" || !directory.empty();
    }

    /**
     * Read the "logging" section (level, console, file, directory)
     */
    static LoggingConfig from_configuration(const Configuration& configuration);
};

/**
 * Thread-safe logger shared by the acquisition and scene threads
 *
 * Every sink write happens under one mutex. Each line carries the component
 * that produced it:
 *   [2025-01-01 12:00:00.000] [INFO] [GesturePipeline] started (GesturePipeline.cpp:98)
 * Messages that pass the level filter are counted per level so a replay can
 * report how many warnings and errors a session produced.
 */
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level) { minLevel_ = level; }

    LogLevel getLevel() const { return minLevel_; }

    bool isEnabled(LogLevel level) const { return level >= minLevel_; }

    void setConsoleOutput(bool enable);

    /**
     * Apply a logging configuration: level, console sink and file sink
     *
     * @return false if a file sink was requested but could not be opened;
     *         console logging stays active in that case
     */
    bool configure(const LoggingConfig& config);

    /**
     * Append to the given log file (closes any previous one)
     */
    bool setLogFile(const std::string& filename);

    /**
     * Open log_handcad_<date>_<time>.txt under directory, creating it if needed
     */
    bool openTimestampedLog(const std::string& directory);

    void closeLogFile();

    /**
     * Current log file path (empty if no file logging)
     */
    std::string getCurrentLogFile() const;

    void flush();

    void log(LogLevel level, const std::string& component, const std::string& message,
             const std::string& file = "", int line = 0);

    void trace(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::TRACE, "", msg, file, line);
    }

    void debug(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::DEBUG, "", msg, file, line);
    }

    void info(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::INFO, "", msg, file, line);
    }

    void warning(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::WARNING, "", msg, file, line);
    }

    void error(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::ERROR, "", msg, file, line);
    }

    void critical(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::CRITICAL, "", msg, file, line);
    }

    /**
     * Number of messages written at the given level since the last reset
     */
    std::uint64_t getMessageCount(LogLevel level) const;

    void resetCounters();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool openFileLocked(const std::string& filename);
    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& component,
                              const std::string& message,
                              const std::string& file, int line) const;

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string currentLogFile_;
    std::array<std::uint64_t, 6> counts_{};

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

// Convenience macros
#define LOG_TRACE(msg) handcad::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) handcad::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) handcad::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) handcad::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) handcad::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) handcad::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

/**
 * Stream-style logging bound to a component; the line is written when the
 * temporary is destroyed. Formatting is skipped for disabled levels.
 */
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component, const char* file = "", int line = 0)
        : level_(level), enabled_(Logger::getInstance().isEnabled(level)),
          component_(component), file_(file), line_(line) {}

    ~LogStream() {
        if (enabled_) {
            Logger::getInstance().log(level_, component_, stream_.str(), file_, line_);
        }
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

private:
    LogLevel level_;
    bool enabled_;
    std::string component_;
    const char* file_;
    int line_;
    std::ostringstream stream_;
};

#define HANDCAD_LOG_DEBUG(component) \
    handcad::core::LogStream(handcad::core::LogLevel::DEBUG, component, __FILE__, __LINE__)

#define HANDCAD_LOG_INFO(component) \
    handcad::core::LogStream(handcad::core::LogLevel::INFO, component, __FILE__, __LINE__)

#define HANDCAD_LOG_WARNING(component) \
    handcad::core::LogStream(handcad::core::LogLevel::WARNING, component, __FILE__, __LINE__)

#define HANDCAD_LOG_ERROR(component) \
    handcad::core::LogStream(handcad::core::LogLevel::ERROR, component, __FILE__, __LINE__)

} // namespace core
} // namespace handcad
