//! # Logger Implementation
//!
//! Level names, record formatting, sinks, module filter and the Logger itself.

#include "errlens/log/log.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace errlens::log {

namespace {

struct LevelInfo {
    const char* name;
    const char* color;
};

// Indexed by LogLevel
constexpr std::array<LevelInfo, 7> kLevels = {{
    {"TRACE", "\033[90m"},
    {"DEBUG", "\033[36m"},
    {"INFO", "\033[32m"},
    {"WARN", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"FATAL", "\033[1;31m"},
    {"OFF", ""},
}};

const LevelInfo& level_info(LogLevel level) {
    return kLevels[static_cast<size_t>(level)];
}

bool stderr_is_color_terminal() {
#ifdef _WIN32
    HANDLE handle = GetStdHandle(STD_ERROR_HANDLE);
    DWORD mode = 0;
    if (handle == INVALID_HANDLE_VALUE || !GetConsoleMode(handle, &mode))
        return false;
    return SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    if (!isatty(fileno(stderr)))
        return false;
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
#endif
}

void append_json_escaped(std::string& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
        }
    }
}

} // namespace

// ============================================================================
// Levels
// ============================================================================

const char* level_name(LogLevel level) {
    return level_info(level).name;
}

std::optional<LogLevel> try_parse_level(std::string_view name) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "WARNING") {
        return LogLevel::Warn;
    }

    for (size_t i = 0; i < kLevels.size(); ++i) {
        if (upper == kLevels[i].name) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

LogLevel parse_level(std::string_view name) {
    return try_parse_level(name).value_or(LogLevel::Info);
}

// ============================================================================
// Formatting
// ============================================================================

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string format_timestamp(int64_t timestamp_ms) {
    auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    auto millis = static_cast<int>(timestamp_ms % 1000);

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &seconds);
#else
    localtime_r(&seconds, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis;
    return oss.str();
}

std::string format_record(const LogRecord& record, LogFormat format, const char* color) {
    std::string line;
    line.reserve(record.message.size() + 64);

    if (format == LogFormat::JSON) {
        line += "{\"ts\":";
        line += std::to_string(record.timestamp_ms);
        line += ",\"level\":\"";
        line += level_name(record.level);
        line += "\",\"module\":\"";
        append_json_escaped(line, record.module);
        line += "\",\"msg\":\"";
        append_json_escaped(line, record.message);
        line += "\"}\n";
        return line;
    }

    std::string level = level_name(record.level);
    level.resize(5, ' ');

    line += format_timestamp(record.timestamp_ms);
    line += ' ';
    if (color) {
        line += color;
        line += level;
        line += "\033[0m";
    } else {
        line += level;
    }
    line += " [";
    line += record.module;
    line += "] ";
    line += record.message;
    line += '\n';
    return line;
}

// ============================================================================
// Sinks
// ============================================================================

void StreamSink::write(const LogRecord& record) {
    if (out_ == nullptr)
        return;
    // One insertion per record so lines from different sinks never interleave.
    *out_ << format_record(record, format_, color_for(record));
}

void StreamSink::flush() {
    if (out_ != nullptr)
        out_->flush();
}

ConsoleSink::ConsoleSink(bool use_colors)
    : StreamSink(std::cerr), colors_enabled_(use_colors && stderr_is_color_terminal()) {}

const char* ConsoleSink::color_for(const LogRecord& record) const {
    return colors_enabled_ ? level_info(record.level).color : nullptr;
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc)) {
    if (file_.is_open()) {
        set_stream(&file_);
    }
}

void FileSink::write(const LogRecord& record) {
    StreamSink::write(record);
    if (record.level >= LogLevel::Error) {
        flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    while (!spec.empty()) {
        size_t comma = spec.find(',');
        std::string_view token = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view() : spec.substr(comma + 1);

        if (token.empty())
            continue;

        size_t eq = token.find('=');
        if (eq == std::string_view::npos) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        } else if (token.substr(0, eq) == "*") {
            default_level_ = parse_level(token.substr(eq + 1));
        } else {
            module_levels_[std::string(token.substr(0, eq))] = parse_level(token.substr(eq + 1));
        }
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(module);
    LogLevel threshold = it != module_levels_.end() ? it->second : default_level_;
    return level >= threshold;
}

LogLevel LogFilter::min_level() const {
    LogLevel min = default_level_;
    for (const auto& [module, level] : module_levels_) {
        if (level < min)
            min = level;
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    std::vector<std::unique_ptr<LogSink>> sinks;

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        sinks.push_back(std::move(console));
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (file->is_open()) {
            file->set_format(config.format);
            sinks.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }

    LogFilter filter;
    filter.set_default_level(config.level);
    if (!config.filter_spec.empty()) {
        filter.parse(config.filter_spec);
        // Without "*=level" the filter keeps the configured level as its default
        if (config.level < filter.default_level()) {
            filter.set_default_level(config.level);
        }
    }

    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.sinks_ = std::move(sinks);
    logger.filter_ = std::move(filter);
    logger.level_ = logger.filter_.min_level();
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_ && filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{level, module, message, file, line, now_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_ = LogFilter();
    filter_.set_default_level(level);
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace errlens::log
