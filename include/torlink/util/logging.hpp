#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace torlink::util {

struct LoggingConfig;

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

// Parse log level from string; nullopt for unrecognized names
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view str);

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string_view category;

    [[nodiscard]] std::string format() const;
};

// Log sink interface
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Writes to stderr
class ConsoleSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;
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
};

// Collects records in memory (used by tests)
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override {}

    [[nodiscard]] std::vector<LogRecord> records() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

class Logger {
public:
    Logger() = default;
    explicit Logger(std::string_view category) : category_(category) {}

    void set_level(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel level() const { return min_level_; }

    void add_sink(std::shared_ptr<LogSink> sink);
    void clear_sinks();

    [[nodiscard]] bool is_enabled(LogLevel level) const {
        return level != LogLevel::Off && level >= min_level_;
    }

    template <typename... Args>
    void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(level)) {
            do_log(level, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void trace(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void fatal(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Fatal, fmt, std::forward<Args>(args)...);
    }

    void flush();

private:
    void do_log(LogLevel level, std::string message);

    std::string_view category_{"torlink"};
    LogLevel min_level_{LogLevel::Info};
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::mutex mutex_;
};

Logger& global_logger();

// Reset the global logger from a [logging] section
void configure_logging(const LoggingConfig& config);

#define LOG_TRACE(...) ::torlink::util::global_logger().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::torlink::util::global_logger().debug(__VA_ARGS__)
#define LOG_INFO(...) ::torlink::util::global_logger().info(__VA_ARGS__)
#define LOG_WARN(...) ::torlink::util::global_logger().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::torlink::util::global_logger().error(__VA_ARGS__)
#define LOG_FATAL(...) ::torlink::util::global_logger().fatal(__VA_ARGS__)

}  // namespace torlink::util
