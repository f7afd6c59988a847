// PYTHCLIENT - Logging System
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// Provides a small logging system with:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Named categories for filtering
// - Pluggable sinks (console, callback)
// - Printf-style and stream-style interfaces

#ifndef PYTHCLIENT_UTIL_LOGGING_H
#define PYTHCLIENT_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace pythclient {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive, defaults to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* ORACLE = "oracle";   // account decoding
    constexpr const char* GRAPH = "graph";     // chain traversal
    constexpr const char* SOURCE = "source";   // account sources
    constexpr const char* CLI = "cli";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stderr, optionally colored
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool showTimestamp{true};
        bool showCategory{true};
        bool showLocation{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    /// Render an entry the way Write() prints it (without color)
    std::string Format(const LogEntry& entry) const;

private:
    Config config_;
    std::mutex mutex_;
};

/// Hands every entry to a callback (tests, embedding applications)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    /// Log with printf-style formatting
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and logs it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define PYTHCLIENT_LOGGER ::pythclient::util::Logger::Instance()

#define PYTHCLIENT_LOG_ENABLED(level, category) \
    PYTHCLIENT_LOGGER.WillLog(::pythclient::util::LogLevel::level, category)

#define PYTHCLIENT_LOG(level, category) \
    if (PYTHCLIENT_LOG_ENABLED(level, category)) \
        ::pythclient::util::LogStream(::pythclient::util::LogLevel::level, category, \
                                      __FILE__, __LINE__)

#define LOG_TRACE(category)   PYTHCLIENT_LOG(Trace, category)
#define LOG_DEBUG(category)   PYTHCLIENT_LOG(Debug, category)
#define LOG_INFO(category)    PYTHCLIENT_LOG(Info, category)
#define LOG_WARN(category)    PYTHCLIENT_LOG(Warn, category)
#define LOG_ERROR(category)   PYTHCLIENT_LOG(Error, category)

#define PYTHCLIENT_LOGF(level, category, ...) \
    do { \
        if (PYTHCLIENT_LOG_ENABLED(level, category)) { \
            PYTHCLIENT_LOGGER.LogF(::pythclient::util::LogLevel::level, category, \
                                   __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogInfoF(category, ...)   PYTHCLIENT_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   PYTHCLIENT_LOGF(Warn, category, __VA_ARGS__)

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace pythclient

#endif // PYTHCLIENT_UTIL_LOGGING_H
