#include <algorithm>
#include <cctype>
#include <ctime>
#include <hyper-cri/core/logger.hpp>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace hyper_cri {

std::unordered_map<std::string, std::unique_ptr<Logger>> Logger::instances_;
std::mutex Logger::instances_mutex_;

namespace {

void replaceAll(std::string& text, const std::string& token, const std::string& value)
{
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.length(), value);
        pos += value.length();
    }
}

} // namespace

Logger* Logger::getInstance(const std::string& name)
{
    std::lock_guard<std::mutex> lock(instances_mutex_);

    auto it = instances_.find(name);
    if (it == instances_.end()) {
        it = instances_.emplace(name, std::unique_ptr<Logger>(new Logger(name))).first;
    }

    return it->second.get();
}

void Logger::resetInstance(const std::string& name)
{
    std::lock_guard<std::mutex> lock(instances_mutex_);
    instances_.erase(name);
}

Logger::Logger(const std::string& name)
    : name_(name), level_(LogLevel::INFO),
      pattern_("%t [%l] %n: %v"), // timestamp [level] name: message
      console_sink_enabled_(true)
{}

Logger::~Logger()
{
    flush();

    std::lock_guard<std::mutex> lock(file_sinks_mutex_);
    file_sinks_.clear();
}

void Logger::setLevel(LogLevel level)
{
    level_ = level;
}

LogLevel Logger::getLevel() const
{
    return level_;
}

bool Logger::isLevelEnabled(LogLevel level) const
{
    return level >= level_.load();
}

void Logger::setPattern(const std::string& pattern)
{
    std::lock_guard<std::mutex> lock(pattern_mutex_);
    pattern_ = pattern;
}

void Logger::setConsoleSinkEnabled(bool enabled)
{
    console_sink_enabled_ = enabled;
}

void Logger::addSink(LogSink sink, LogLevel level)
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back({std::move(sink), level});
}

void Logger::addFileSink(const std::filesystem::path& file_path, LogLevel level)
{
    const std::string key = file_path.string();
    {
        std::lock_guard<std::mutex> lock(file_sinks_mutex_);

        std::filesystem::path dir = file_path.parent_path();
        if (!dir.empty() && !std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }

        auto& file_stream = file_sinks_[key];
        if (file_stream) {
            return;
        }
        file_stream = std::make_unique<std::ofstream>(file_path, std::ios::app);
        if (!file_stream->is_open()) {
            file_sinks_.erase(key);
            throw std::runtime_error("Failed to open log file: " + key);
        }
    }

    addSink([this, key](const LogMessage& message) { writeToFile(key, message); }, level);
}

void Logger::clearSinks()
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();

    std::lock_guard<std::mutex> file_lock(file_sinks_mutex_);
    file_sinks_.clear();
}

void Logger::flush()
{
    std::lock_guard<std::mutex> file_lock(file_sinks_mutex_);
    for (auto& [path, stream] : file_sinks_) {
        if (stream && stream->is_open()) {
            stream->flush();
        }
    }
    std::cout.flush();
}

std::string Logger::getName() const
{
    return name_;
}

void Logger::log(LogLevel level, const std::string& message)
{
    LogMessage log_message;
    log_message.level = level;
    log_message.message = message;
    log_message.logger_name = name_;
    log_message.thread_id = std::this_thread::get_id();
    log_message.timestamp = std::chrono::system_clock::now();

    if (console_sink_enabled_) {
        std::cout << formatMessage(log_message) << std::endl;
    }

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink_info : sinks_) {
        if (level >= sink_info.level) {
            sink_info.sink(log_message);
        }
    }
}

void Logger::writeToFile(const std::string& file_path, const LogMessage& message)
{
    std::lock_guard<std::mutex> lock(file_sinks_mutex_);

    auto it = file_sinks_.find(file_path);
    if (it != file_sinks_.end() && it->second && it->second->is_open()) {
        *it->second << formatMessage(message) << std::endl;
    }
}

std::string Logger::formatMessage(const LogMessage& message) const
{
    std::string result;
    {
        std::lock_guard<std::mutex> lock(pattern_mutex_);
        result = pattern_;
    }

    // %t and %T first so that the substituted message text is never rescanned
    if (result.find("%t") != std::string::npos) {
        auto time_t = std::chrono::system_clock::to_time_t(message.timestamp);
        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);
        std::ostringstream time_stream;
        time_stream << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        replaceAll(result, "%t", time_stream.str());
    }

    if (result.find("%T") != std::string::npos) {
        std::ostringstream thread_stream;
        thread_stream << message.thread_id;
        replaceAll(result, "%T", thread_stream.str());
    }

    replaceAll(result, "%l", toString(message.level));
    replaceAll(result, "%n", message.logger_name);
    replaceAll(result, "%v", message.message);

    return result;
}

std::string toString(LogLevel level)
{
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::CRITICAL:
            return "CRITICAL";
        default:
            return "UNKNOWN";
    }
}

LogLevel fromString(const std::string& level_str)
{
    std::string upper_str = level_str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper_str == "TRACE")
        return LogLevel::TRACE;
    if (upper_str == "DEBUG")
        return LogLevel::DEBUG;
    if (upper_str == "INFO")
        return LogLevel::INFO;
    if (upper_str == "WARNING" || upper_str == "WARN")
        return LogLevel::WARNING;
    if (upper_str == "ERROR")
        return LogLevel::ERROR;
    if (upper_str == "CRITICAL")
        return LogLevel::CRITICAL;

    // Default to INFO for invalid strings
    return LogLevel::INFO;
}

} // namespace hyper_cri
