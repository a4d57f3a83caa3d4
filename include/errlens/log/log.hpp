//! # errlens Logging
//!
//! Module-tagged logging used across the classifier, config loader and driver.
//! Records go through a module filter, then to every registered sink:
//!
//! ```text
//! ERRLENS_LOG_DEBUG("classify", ...)
//!   -> Logger::should_log(level, module)     LogFilter: "classify=trace,*=warn"
//!   -> LogRecord
//!   -> ConsoleSink (stderr) / FileSink / StreamSink
//!        text: "2026-10-19 14:03:07.512 DEBUG [classify] message"
//!        json: {"ts":...,"level":"DEBUG","module":"classify","msg":"message"}
//! ```
//!
//! Message expressions are only evaluated when the record will be written.
//! `ERRLENS_MIN_LOG_LEVEL` removes lower levels at compile time.

#ifndef ERRLENS_LOG_HPP
#define ERRLENS_LOG_HPP

#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace errlens::log {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Disables all logging
};

/// Upper-case name, e.g. "WARN".
const char* level_name(LogLevel level);

/// Parses a level name in any case; "warning" is accepted for Warn.
std::optional<LogLevel> try_parse_level(std::string_view name);

/// Like try_parse_level(), falling back to Info for unknown names.
LogLevel parse_level(std::string_view name);

// ============================================================================
// Records and Formatting
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< e.g. "classify", "config"
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Milliseconds since the Unix epoch
};

enum class LogFormat {
    Text, ///< "<date> <time> LEVEL [module] message"
    JSON  ///< One object per line
};

/// Renders one record as a complete line, newline included. `color`, when
/// given, wraps the level name (text format only).
std::string format_record(const LogRecord& record, LogFormat format,
                          const char* color = nullptr);

/// Local time of `timestamp_ms` as "YYYY-MM-DD HH:MM:SS.mmm".
std::string format_timestamp(int64_t timestamp_ms);

/// Milliseconds since the Unix epoch.
int64_t now_ms();

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Base for sinks that render records as lines onto a stream.
class StreamSink : public LogSink {
public:
    /// `out` must outlive the sink.
    explicit StreamSink(std::ostream& out, LogFormat format = LogFormat::Text)
        : out_(&out), format_(format) {}

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }
    LogFormat format() const {
        return format_;
    }

protected:
    StreamSink() = default;

    void set_stream(std::ostream* out) {
        out_ = out;
    }

    /// Color for the level name of `record`, or nullptr for none.
    virtual const char* color_for(const LogRecord& /*record*/) const {
        return nullptr;
    }

private:
    std::ostream* out_ = nullptr;
    LogFormat format_ = LogFormat::Text;
};

/// Writes to stderr, coloring level names when stderr is a color terminal.
class ConsoleSink : public StreamSink {
public:
    explicit ConsoleSink(bool use_colors = true);

protected:
    const char* color_for(const LogRecord& record) const override;

private:
    bool colors_enabled_;
};

/// Writes to a file. Flushes after Error and Fatal records.
class FileSink : public StreamSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;

    bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

// ============================================================================
// Module Filter
// ============================================================================

/// Per-module minimum levels.
///
/// Filter strings look like "classify=trace,config=debug,*=warn". A bare
/// module name enables Trace for that module.
class LogFilter {
public:
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }
    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level across the default and every module override.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty = no file sink
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Starts with a Warn-level console sink until init().
class Logger {
public:
    static Logger& instance();

    /// Replaces the sinks and levels of the instance with `config`.
    static void init(const LogConfig& config);

    /// Checked by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    void set_level(LogLevel level);
    LogLevel level() const;

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Builds a LogConfig from --log-level=, --log-filter=, --log-file=,
/// --log-format=, -v/-vv/-vvv, --verbose and -q/--quiet. Without a level or
/// filter option, ERRLENS_LOG is read: a value containing '=' or ',' is a
/// filter, anything else a level.
LogConfig parse_log_options(int argc, char* argv[]);

/// True if `arg` is consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Macros
// ============================================================================

// 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef ERRLENS_MIN_LOG_LEVEL
#define ERRLENS_MIN_LOG_LEVEL 0
#endif

#define ERRLENS_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= ERRLENS_MIN_LOG_LEVEL) {                                    \
            auto& errlens_logger_ = ::errlens::log::Logger::instance();                            \
            if (errlens_logger_.should_log(level, module_str)) {                                   \
                std::ostringstream errlens_oss_;                                                   \
                errlens_oss_ << msg;                                                               \
                errlens_logger_.log(level, module_str, errlens_oss_.str(), __FILE__, __LINE__);    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define ERRLENS_LOG_TRACE(module, msg) ERRLENS_LOG_IMPL(::errlens::log::LogLevel::Trace, module, msg)
#define ERRLENS_LOG_DEBUG(module, msg) ERRLENS_LOG_IMPL(::errlens::log::LogLevel::Debug, module, msg)
#define ERRLENS_LOG_INFO(module, msg) ERRLENS_LOG_IMPL(::errlens::log::LogLevel::Info, module, msg)
#define ERRLENS_LOG_WARN(module, msg) ERRLENS_LOG_IMPL(::errlens::log::LogLevel::Warn, module, msg)
#define ERRLENS_LOG_ERROR(module, msg) ERRLENS_LOG_IMPL(::errlens::log::LogLevel::Error, module, msg)
#define ERRLENS_LOG_FATAL(module, msg) ERRLENS_LOG_IMPL(::errlens::log::LogLevel::Fatal, module, msg)

} // namespace errlens::log

#endif // ERRLENS_LOG_HPP
