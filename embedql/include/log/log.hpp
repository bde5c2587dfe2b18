//! # embedql Logging
//!
//! Leveled, module-tagged logging used by every pipeline stage:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module tags (`extract`, `memo`, `parser`, `cache`, `filter`, `cli`)
//!   for per-component filtering
//! - Console, file, null and fan-out sinks
//! - Compile-time level elision via EMBEDQL_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! EMBEDQL_LOG_DEBUG("cache", "hit " << file.rel_path);
//! EMBEDQL_LOG_WARN("filter", "cannot read " << path << ": " << err.message);
//! ```

#ifndef EMBEDQL_LOG_HPP
#define EMBEDQL_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace embedql::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Per-span and per-lookup tracing
    Debug = 1, ///< Cache hits, misses and timings
    Info = 2,  ///< Run summaries
    Warn = 3,  ///< Recoverable problems (unreadable file in the filter)
    Error = 4, ///< Failed parses
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a level (e.g. "DEBUG").
[[nodiscard]] const char* level_name(LogLevel level);

/// Parses a level name, either case. Unknown names map to Info.
[[nodiscard]] LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Renders a record as a single text line (no trailing newline).
[[nodiscard]] std::string format_text(const LogRecord& record, bool colors = false);

/// Renders a record as a single JSON object (no trailing newline).
[[nodiscard]] std::string format_json(const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends to a file. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans records out to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Parses specs like "cache=debug,extract=trace,*=warn". A bare module name
/// enables Trace for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    [[nodiscard]] bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured anywhere, for the logger's fast path.
    [[nodiscard]] LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Module filter string
    std::string log_file;    ///< Empty = no file sink
    bool console = true;
    bool colors = true;
};

/// Process-wide logger.
///
/// Auto-initializes with a console sink at Warn if `init()` is never called.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    [[nodiscard]] bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    /// Replaces all sinks with the given one (tests install capture sinks).
    void set_sink(std::unique_ptr<LogSink> sink);

    void add_sink(std::unique_ptr<LogSink> sink);

    void set_level(LogLevel level);

    [[nodiscard]] LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Extracts logging options from argv: --log-level=, --log-filter=,
/// --log-file=, --log-format=, -v/-vv/-vvv, -q. Falls back to the
/// EMBEDQL_LOG environment variable when no level or filter was given.
LogConfig parse_log_options(int argc, char* argv[]);

/// True if `arg` is one of the flags consumed by parse_log_options().
[[nodiscard]] bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef EMBEDQL_MIN_LOG_LEVEL
#define EMBEDQL_MIN_LOG_LEVEL 0
#endif

#define EMBEDQL_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= EMBEDQL_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::embedql::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define EMBEDQL_LOG_TRACE(module, msg) EMBEDQL_LOG_IMPL(::embedql::log::LogLevel::Trace, module, msg)
#define EMBEDQL_LOG_DEBUG(module, msg) EMBEDQL_LOG_IMPL(::embedql::log::LogLevel::Debug, module, msg)
#define EMBEDQL_LOG_INFO(module, msg) EMBEDQL_LOG_IMPL(::embedql::log::LogLevel::Info, module, msg)
#define EMBEDQL_LOG_WARN(module, msg) EMBEDQL_LOG_IMPL(::embedql::log::LogLevel::Warn, module, msg)
#define EMBEDQL_LOG_ERROR(module, msg) EMBEDQL_LOG_IMPL(::embedql::log::LogLevel::Error, module, msg)
#define EMBEDQL_LOG_FATAL(module, msg) EMBEDQL_LOG_IMPL(::embedql::log::LogLevel::Fatal, module, msg)

} // namespace embedql::log

#endif // EMBEDQL_LOG_HPP
