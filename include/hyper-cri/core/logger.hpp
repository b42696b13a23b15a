#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace hyper_cri {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

struct LogMessage {
    LogLevel level;
    std::string message;
    std::string logger_name;
    std::thread::id thread_id;
    std::chrono::system_clock::time_point timestamp;
};

using LogSink = std::function<void(const LogMessage&)>;

/**
 * Named logger. Instances live in a process registry so a caller can look one
 * up by name, but runtime components never do that themselves: they receive
 * the Logger* they should write to when they are constructed.
 */
class Logger {
public:
    static Logger* getInstance(const std::string& name = "hyper-cri");
    static void resetInstance(const std::string& name = "hyper-cri");

    ~Logger();

    // Configuration methods
    void setLevel(LogLevel level);
    LogLevel getLevel() const;
    bool isLevelEnabled(LogLevel level) const;
    void setPattern(const std::string& pattern);
    void setConsoleSinkEnabled(bool enabled);

    // Logging methods
    template<typename... Args>
    void trace(const std::string& format, Args&&... args);

    template<typename... Args>
    void debug(const std::string& format, Args&&... args);

    template<typename... Args>
    void info(const std::string& format, Args&&... args);

    template<typename... Args>
    void warning(const std::string& format, Args&&... args);

    template<typename... Args>
    void error(const std::string& format, Args&&... args);

    template<typename... Args>
    void critical(const std::string& format, Args&&... args);

    // Sink management
    void addSink(LogSink sink, LogLevel level = LogLevel::TRACE);
    void addFileSink(const std::filesystem::path& file_path, LogLevel level = LogLevel::INFO);
    void clearSinks();

    void flush();
    std::string getName() const;

private:
    explicit Logger(const std::string& name);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void log(LogLevel level, const std::string& message);
    void writeToFile(const std::string& file_path, const LogMessage& message);
    std::string formatMessage(const LogMessage& message) const;

    template<typename... Args>
    std::string formatString(const std::string& format, Args&&... args) const;

    static std::unordered_map<std::string, std::unique_ptr<Logger>> instances_;
    static std::mutex instances_mutex_;

    std::string name_;
    std::atomic<LogLevel> level_;
    std::string pattern_;
    std::atomic<bool> console_sink_enabled_;

    struct SinkInfo {
        LogSink sink;
        LogLevel level;
    };

    std::vector<SinkInfo> sinks_;
    std::map<std::string, std::unique_ptr<std::ofstream>> file_sinks_;
    std::mutex sinks_mutex_;
    std::mutex file_sinks_mutex_;
    mutable std::mutex pattern_mutex_;
};

// Utility functions
std::string toString(LogLevel level);
LogLevel fromString(const std::string& level_str);

// Template implementations
template<typename... Args>
void Logger::trace(const std::string& format, Args&&... args) {
    if (isLevelEnabled(LogLevel::TRACE)) {
        log(LogLevel::TRACE, formatString(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void Logger::debug(const std::string& format, Args&&... args) {
    if (isLevelEnabled(LogLevel::DEBUG)) {
        log(LogLevel::DEBUG, formatString(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void Logger::info(const std::string& format, Args&&... args) {
    if (isLevelEnabled(LogLevel::INFO)) {
        log(LogLevel::INFO, formatString(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void Logger::warning(const std::string& format, Args&&... args) {
    if (isLevelEnabled(LogLevel::WARNING)) {
        log(LogLevel::WARNING, formatString(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void Logger::error(const std::string& format, Args&&... args) {
    if (isLevelEnabled(LogLevel::ERROR)) {
        log(LogLevel::ERROR, formatString(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void Logger::critical(const std::string& format, Args&&... args) {
    if (isLevelEnabled(LogLevel::CRITICAL)) {
        log(LogLevel::CRITICAL, formatString(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
std::string Logger::formatString(const std::string& format, Args&&... args) const {
    // Substitute {} placeholders left to right; surplus arguments are dropped
    std::string result = format;
    size_t pos = 0;

    auto format_arg = [&](auto&& arg) {
        size_t brace_pos = result.find("{}", pos);
        if (brace_pos == std::string::npos) {
            return;
        }
        std::ostringstream oss;
        oss << arg;
        const std::string text = oss.str();
        result.replace(brace_pos, 2, text);
        pos = brace_pos + text.length();
    };

    (format_arg(args), ...);

    return result;
}

} // namespace hyper_cri
