//! # Logger Implementation

#include "log/log.hpp"

#include "json/json_value.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define NOTATE_STDERR_IS_TTY() (_isatty(_fileno(stderr)) != 0)
#else
#include <unistd.h>
#define NOTATE_STDERR_IS_TTY() (isatty(fileno(stderr)) != 0)
#endif

namespace notate::log {

namespace {

constexpr std::array<const char*, 7> LEVEL_NAMES = {"TRACE", "DEBUG", "INFO", "WARN",
                                                    "ERROR", "FATAL", "OFF"};

auto now_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// `HH:MM:SS.mmm` in local time.
auto clock_time(int64_t timestamp_ms) -> std::string {
    auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min,
                  local.tm_sec, static_cast<int>(timestamp_ms % 1000));
    return buf;
}

auto color_of(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    default:
        return "";
    }
}

auto terminal_supports_color() -> bool {
    if (!NOTATE_STDERR_IS_TTY()) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

} // namespace

auto level_name(LogLevel level) -> const char* {
    auto index = static_cast<size_t>(level);
    return index < LEVEL_NAMES.size() ? LEVEL_NAMES[index] : "???";
}

auto parse_level(std::string_view name) -> std::optional<LogLevel> {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        if (upper == LEVEL_NAMES[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

auto is_known_module(std::string_view module) -> bool {
    return std::find(MODULES.begin(), MODULES.end(), module) != MODULES.end();
}

auto format_record(const LogRecord& record, LogFormat format) -> std::string {
    if (format == LogFormat::JSON) {
        auto obj = json::json_object();
        obj.set("ts", json::JsonValue(record.timestamp_ms));
        obj.set("level", json::JsonValue(level_name(record.level)));
        obj.set("module", json::JsonValue(record.module));
        obj.set("msg", json::JsonValue(record.message));
        return obj.to_string();
    }

    std::string line = clock_time(record.timestamp_ms);
    std::string level = level_name(record.level);
    level.resize(5, ' ');
    line += " " + level + " [" + std::string(record.module) + "] " + record.message;
    return line;
}

// ============================================================================
// Sinks
// ============================================================================

void StreamSink::write(const LogRecord& record) {
    if (colors_ && format_ == LogFormat::Text) {
        out_ << color_of(record.level) << format_record(record, format_) << "\033[0m\n";
    } else {
        out_ << format_record(record, format_) << "\n";
    }
}

void StreamSink::flush() {
    out_.flush();
}

FileSink::FileSink(const std::string& path, LogFormat format, bool append)
    : file_(path, append ? std::ios::app : std::ios::trunc), format_(format) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << format_record(record, format_) << "\n";
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

auto LogFilter::parse(std::string_view spec) -> std::vector<std::string> {
    std::vector<std::string> problems;
    levels_.clear();

    while (!spec.empty()) {
        auto comma = spec.find(',');
        auto entry = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view() : spec.substr(comma + 1);
        if (entry.empty()) {
            continue;
        }

        auto eq = entry.find('=');
        auto module = entry.substr(0, eq);
        LogLevel level = LogLevel::Trace;
        if (eq != std::string_view::npos) {
            auto parsed = parse_level(entry.substr(eq + 1));
            if (!parsed) {
                problems.push_back("unknown log level '" + std::string(entry.substr(eq + 1)) +
                                   "' for '" + std::string(module) + "'");
                continue;
            }
            level = *parsed;
        }

        if (module == "*") {
            fallback_ = level;
            continue;
        }
        if (!is_known_module(module)) {
            problems.push_back("unknown log module '" + std::string(module) + "'");
        }
        levels_[std::string(module)] = level;
    }
    return problems;
}

auto LogFilter::allows(LogLevel level, std::string_view module) const -> bool {
    if (level == LogLevel::Off) {
        return false;
    }
    auto it = levels_.find(module);
    return level >= (it != levels_.end() ? it->second : fallback_);
}

auto LogFilter::threshold() const -> LogLevel {
    LogLevel lowest = fallback_;
    for (const auto& [_, level] : levels_) {
        lowest = std::min(lowest, level);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(make_box<StreamSink>(std::cerr));
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

auto Logger::init(const LogConfig& config) -> std::vector<std::string> {
    auto& logger = instance();
    std::vector<std::string> warnings;

    LogFilter filter(config.level);
    if (!config.filter_spec.empty()) {
        warnings = filter.parse(config.filter_spec);
    }

    std::vector<Box<LogSink>> sinks;
    if (config.console) {
        sinks.push_back(
            make_box<StreamSink>(std::cerr, config.format, config.colors && terminal_supports_color()));
    }
    if (!config.log_file.empty()) {
        auto file = make_box<FileSink>(config.log_file, config.format);
        if (file->is_open()) {
            sinks.push_back(std::move(file));
        } else {
            warnings.push_back("cannot open log file '" + config.log_file + "'");
        }
    }

    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.filter_ = std::move(filter);
    logger.threshold_ = logger.filter_.threshold();
    logger.sinks_ = std::move(sinks);
    return warnings;
}

auto Logger::enabled(LogLevel level, std::string_view module) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= threshold_ && filter_.allows(level, module);
}

void Logger::log(LogLevel level, std::string_view module, std::string message, const char* file,
                 int line) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = file;
    record.line = line;
    record.timestamp_ms = now_ms();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(Box<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_ = LogFilter(level);
    threshold_ = level;
}

auto Logger::set_filter(std::string_view spec) -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto problems = filter_.parse(spec);
    threshold_ = filter_.threshold();
    return problems;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace notate::log
