#include "torlink/util/logging.hpp"
#include "torlink/util/config.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace torlink::util {

Logger& global_logger() {
    static Logger instance;
    return instance;
}

void configure_logging(const LoggingConfig& config) {
    auto& logger = global_logger();
    logger.set_level(parse_log_level(config.level).value_or(LogLevel::Info));
    logger.clear_sinks();
    if (config.log_to_console) {
        logger.add_sink(std::make_shared<ConsoleSink>());
    }
    if (!config.log_file.empty()) {
        auto sink = std::make_shared<FileSink>(config.log_file);
        if (sink->is_open()) {
            logger.add_sink(std::move(sink));
        } else {
            logger.warn("could not open log file {}", config.log_file);
        }
    }
}

std::optional<LogLevel> parse_log_level(std::string_view str) {
    if (str == "trace" || str == "TRACE") return LogLevel::Trace;
    if (str == "debug" || str == "DEBUG") return LogLevel::Debug;
    if (str == "info" || str == "INFO") return LogLevel::Info;
    if (str == "warn" || str == "WARN" || str == "warning" || str == "WARNING") return LogLevel::Warn;
    if (str == "error" || str == "ERROR") return LogLevel::Error;
    if (str == "fatal" || str == "FATAL") return LogLevel::Fatal;
    if (str == "off" || str == "OFF") return LogLevel::Off;
    return std::nullopt;
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
    return oss.str();
}

// --- ConsoleSink ---

void ConsoleSink::write(const LogRecord& record) {
    std::cerr << record.format() << "\n";
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// --- FileSink ---

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
    std::fprintf(file_, "%s\n", record.format().c_str());
}

void FileSink::flush() {
    if (!file_) return;
    std::fflush(file_);
}

// --- MemorySink ---

void MemorySink::write(const LogRecord& record) {
    std::lock_guard lock(mutex_);
    records_.push_back(record);
}

std::vector<LogRecord> MemorySink::records() const {
    std::lock_guard lock(mutex_);
    return records_;
}

void MemorySink::clear() {
    std::lock_guard lock(mutex_);
    records_.clear();
}

// --- Logger ---

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(mutex_);
    sinks_.clear();
}

void Logger::do_log(LogLevel level, std::string message) {
    LogRecord record{
        .level = level,
        .message = std::move(message),
        .timestamp = std::chrono::system_clock::now(),
        .category = category_,
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

}  // namespace torlink::util
