#include "keynet/util/logging.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace keynet::util {

Logger& global_logger() {
    static Logger instance("keynet");
    return instance;
}

bool configure_logging(LogLevel level, bool to_console, const std::string& log_file) {
    auto& logger = global_logger();
    logger.set_level(level);
    logger.clear_sinks();
    if (to_console) {
        logger.add_sink(std::make_shared<ConsoleSink>());
    }
    if (!log_file.empty()) {
        auto sink = std::make_shared<FileSink>(log_file);
        if (!sink->is_open()) {
            return false;
        }
        logger.add_sink(std::move(sink));
    }
    return true;
}

bool try_parse_log_level(std::string_view str, LogLevel& out) {
    if (str == "trace" || str == "TRACE") { out = LogLevel::Trace; return true; }
    if (str == "debug" || str == "DEBUG") { out = LogLevel::Debug; return true; }
    if (str == "info" || str == "INFO") { out = LogLevel::Info; return true; }
    if (str == "warn" || str == "WARN" || str == "warning" || str == "WARNING") {
        out = LogLevel::Warn;
        return true;
    }
    if (str == "error" || str == "ERROR") { out = LogLevel::Error; return true; }
    if (str == "fatal" || str == "FATAL") { out = LogLevel::Fatal; return true; }
    if (str == "off" || str == "OFF") { out = LogLevel::Off; return true; }
    return false;
}

LogLevel parse_log_level(std::string_view str) {
    LogLevel level = LogLevel::Info;
    (void)try_parse_log_level(str, level);
    return level;
}

std::string LogRecord::format() const {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << " [" << log_level_name(level) << "] ";
    if (!category.empty()) {
        oss << "[" << category << "] ";
    }
    oss << message;
    if (level <= LogLevel::Debug && !file.empty()) {
        auto slash = file.find_last_of('/');
        auto base = slash == std::string_view::npos ? file : file.substr(slash + 1);
        oss << " (" << base << ":" << line << ")";
    }
    return oss.str();
}

// ConsoleSink implementation
void ConsoleSink::write(const LogRecord& record) {
    std::lock_guard lock(mutex_);
    std::cerr << record.format() << "\n";
}

void ConsoleSink::flush() {
    std::lock_guard lock(mutex_);
    std::cerr.flush();
}

// FileSink implementation
FileSink::FileSink(const std::string& path) : path_(path) {
    file_ = std::fopen(path.c_str(), "a");
}

FileSink::~FileSink() {
    if (file_) {
        std::fclose(file_);
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_) return;
    std::lock_guard lock(mutex_);
    std::fprintf(file_, "%s\n", record.format().c_str());
}

void FileSink::flush() {
    if (!file_) return;
    std::lock_guard lock(mutex_);
    std::fflush(file_);
}

// Logger implementation
Logger::Logger() = default;

Logger::Logger(std::string_view category) : category_(category) {}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(mutex_);
    sinks_.clear();
}

void Logger::do_log(LogLevel level, std::string message, std::source_location loc) {
    LogRecord record{
        .level = level,
        .message = std::move(message),
        .file = loc.file_name(),
        .line = loc.line(),
        .timestamp = std::chrono::system_clock::now(),
        .category = category_
    };

    std::lock_guard lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

}  // namespace keynet::util
