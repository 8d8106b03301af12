#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace keynet::util {

// Log levels
enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6,
};

[[nodiscard]] constexpr const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off: return "OFF";
        default: return "UNKNOWN";
    }
}

// Parse log level from string; unknown names map to Info
[[nodiscard]] LogLevel parse_log_level(std::string_view str);

// Same as parse_log_level but reports unknown names
[[nodiscard]] bool try_parse_log_level(std::string_view str, LogLevel& out);

struct LogRecord {
    LogLevel level;
    std::string message;
    std::string_view file;
    uint32_t line;
    std::chrono::system_clock::time_point timestamp;
    std::string_view category;

    // "time [LEVEL] [category] message"; Trace and Debug records add file:line
    [[nodiscard]] std::string format() const;
};

// Log sink interface
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Writes to stderr; stdout is reserved for command output
class ConsoleSink : public LogSink {
public:
    ConsoleSink() = default;

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::mutex mutex_;
};

// Appends to a file
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] bool is_open() const { return file_ != nullptr; }
    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
    std::FILE* file_{nullptr};
    std::mutex mutex_;
};

class Logger {
public:
    Logger();
    explicit Logger(std::string_view category);

    void set_level(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel level() const { return min_level_; }

    void add_sink(std::shared_ptr<LogSink> sink);
    void clear_sinks();

    [[nodiscard]] bool is_enabled(LogLevel level) const {
        return level >= min_level_;
    }

    // Call sites go through the LOG_ macros so the record carries their location
    template <typename... Args>
    void log(LogLevel level,
             std::source_location loc,
             std::format_string<Args...> fmt,
             Args&&... args) {
        if (is_enabled(level)) {
            do_log(level, std::format(fmt, std::forward<Args>(args)...), loc);
        }
    }

    void flush();

private:
    void do_log(LogLevel level, std::string message, std::source_location loc);

    std::string_view category_;
    LogLevel min_level_{LogLevel::Info};
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::mutex mutex_;
};

Logger& global_logger();

// Replace the global logger's sinks. Returns false if the log file could not be opened.
bool configure_logging(LogLevel level, bool to_console = true, const std::string& log_file = "");

#define KEYNET_LOG_AT(level, ...) \
    ::keynet::util::global_logger().log( \
        level, std::source_location::current(), __VA_ARGS__)

#define LOG_TRACE(...) KEYNET_LOG_AT(::keynet::util::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) KEYNET_LOG_AT(::keynet::util::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) KEYNET_LOG_AT(::keynet::util::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) KEYNET_LOG_AT(::keynet::util::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) KEYNET_LOG_AT(::keynet::util::LogLevel::Error, __VA_ARGS__)
#define LOG_FATAL(...) KEYNET_LOG_AT(::keynet::util::LogLevel::Fatal, __VA_ARGS__)

}  // namespace keynet::util
