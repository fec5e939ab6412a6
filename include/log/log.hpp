//! # Logging
//!
//! Module-tagged logging for the annotation pipeline. Every record names the
//! stage that produced it, so a single stage can be traced without drowning in
//! the others:
//!
//! | Module | Emitted by |
//! |--------|------------|
//! | `directive` | directive extraction from comments |
//! | `evaluator` | argument evaluation |
//! | `registry` | registration and instantiation |
//! | `expand` | validation and expansion of elements |
//! | `cli` | the command-line host |
//!
//! ## Usage
//!
//! ```cpp
//! NOTATE_LOG_DEBUG("evaluator", "Evaluating '" << text << "'");
//! NOTATE_LOG_WARN("expand", error.to_string());
//! ```
//!
//! Filters use `module=level` pairs with `*` as the fallback, for example
//! `evaluator=trace,*=warn`.

#ifndef NOTATE_LOG_HPP
#define NOTATE_LOG_HPP

#include "common.hpp"

#include <array>
#include <cstdint>
#include <fstream>
#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace notate::log {

// ============================================================================
// Levels and Modules
// ============================================================================

enum class LogLevel : int { Trace = 0, Debug, Info, Warn, Error, Fatal, Off };

/// Upper-case name, e.g. "WARN".
[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Parses a level name in lower or upper case.
[[nodiscard]] auto parse_level(std::string_view name) -> std::optional<LogLevel>;

/// Modules that emit records.
inline constexpr std::array<std::string_view, 5> MODULES = {"directive", "evaluator", "registry",
                                                            "expand", "cli"};

[[nodiscard]] auto is_known_module(std::string_view module) -> bool;

// ============================================================================
// Records and Sinks
// ============================================================================

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view module;
    std::string message;
    const char* file = nullptr;
    int line = 0;
    int64_t timestamp_ms = 0;
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One object per line with `ts`, `level`, `module`, `msg`
};

/// Renders a record as one line without the trailing newline.
[[nodiscard]] auto format_record(const LogRecord& record, LogFormat format) -> std::string;

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes records to a stream it does not own (stderr for the CLI).
class StreamSink : public LogSink {
public:
    explicit StreamSink(std::ostream& out, LogFormat format = LogFormat::Text, bool colors = false)
        : out_(out), format_(format), colors_(colors) {}

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ostream& out_;
    LogFormat format_;
    bool colors_;
};

/// Appends records to a file, flushing after errors.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, LogFormat format = LogFormat::Text,
                      bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::ofstream file_;
    LogFormat format_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module minimum levels with a fallback for everything else.
class LogFilter {
public:
    explicit LogFilter(LogLevel fallback = LogLevel::Warn) : fallback_(fallback) {}

    /// Parses `module=level` pairs. A bare module name enables Trace for it.
    /// Returns the problems found; valid pairs are applied regardless.
    auto parse(std::string_view spec) -> std::vector<std::string>;

    [[nodiscard]] auto allows(LogLevel level, std::string_view module) const -> bool;

    void set_fallback(LogLevel level) {
        fallback_ = level;
    }

    [[nodiscard]] auto fallback() const -> LogLevel {
        return fallback_;
    }

    /// Lowest level any module can pass at.
    [[nodiscard]] auto threshold() const -> LogLevel;

private:
    LogLevel fallback_;
    std::map<std::string, LogLevel, std::less<>> levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file;
    bool console = true;
    bool colors = true;
};

/// Process-wide logger shared by all modules.
///
/// Before `init()` runs, Warn and above go to stderr.
class Logger {
public:
    /// Replaces sinks and levels. Returns warnings about the filter spec and
    /// the log file that the caller should surface.
    static auto init(const LogConfig& config) -> std::vector<std::string>;

    static auto instance() -> Logger&;

    [[nodiscard]] auto enabled(LogLevel level, std::string_view module) const -> bool;

    void log(LogLevel level, std::string_view module, std::string message, const char* file,
             int line);

    void add_sink(Box<LogSink> sink);
    void clear_sinks();

    /// Sets a single level for every module.
    void set_level(LogLevel level);

    /// Replaces the module filter.
    auto set_filter(std::string_view spec) -> std::vector<std::string>;

    void flush();

private:
    Logger();

    LogFilter filter_;
    LogLevel threshold_ = LogLevel::Warn;
    std::vector<Box<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Reads `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`,
/// `-q`/`--quiet` and `-v`/`-vv`/`-vvv` from argv. Without a level or filter
/// on the command line, the NOTATE_LOG environment variable is used.
[[nodiscard]] auto parse_log_options(int argc, char* argv[]) -> Result<LogConfig, std::string>;

/// True when `arg` is one of the flags `parse_log_options` reads.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Macros
// ============================================================================

#ifndef NOTATE_MIN_LOG_LEVEL
#define NOTATE_MIN_LOG_LEVEL 0
#endif

#define NOTATE_LOG_IMPL(level, module, msg)                                                        \
    do {                                                                                           \
        if (static_cast<int>(level) >= NOTATE_MIN_LOG_LEVEL) {                                     \
            auto& notate_logger_ = ::notate::log::Logger::instance();                              \
            if (notate_logger_.enabled(level, module)) {                                           \
                std::ostringstream notate_oss_;                                                    \
                notate_oss_ << msg;                                                                \
                notate_logger_.log(level, module, notate_oss_.str(), __FILE__, __LINE__);          \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define NOTATE_LOG_TRACE(module, msg) NOTATE_LOG_IMPL(::notate::log::LogLevel::Trace, module, msg)
#define NOTATE_LOG_DEBUG(module, msg) NOTATE_LOG_IMPL(::notate::log::LogLevel::Debug, module, msg)
#define NOTATE_LOG_INFO(module, msg) NOTATE_LOG_IMPL(::notate::log::LogLevel::Info, module, msg)
#define NOTATE_LOG_WARN(module, msg) NOTATE_LOG_IMPL(::notate::log::LogLevel::Warn, module, msg)
#define NOTATE_LOG_ERROR(module, msg) NOTATE_LOG_IMPL(::notate::log::LogLevel::Error, module, msg)
#define NOTATE_LOG_FATAL(module, msg) NOTATE_LOG_IMPL(::notate::log::LogLevel::Fatal, module, msg)

} // namespace notate::log

#endif // NOTATE_LOG_HPP
