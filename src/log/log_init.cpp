//! # Logging Options
//!
//! Builds a `LogConfig` from the command line, falling back to NOTATE_LOG.
//! NOTATE_LOG holds either a bare level (`debug`) or a filter
//! (`evaluator=trace,*=warn`).

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace notate::log {

namespace {

/// Number of `v`s in `-v`, `-vv`, `-vvv`; zero for anything else.
auto verbosity_of(std::string_view arg) -> int {
    if (arg.size() < 2 || arg[0] != '-' || arg.find_first_not_of('v', 1) != std::string_view::npos) {
        return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

auto verbosity_level(int count) -> LogLevel {
    if (count >= 3) {
        return LogLevel::Trace;
    }
    return count == 2 ? LogLevel::Debug : LogLevel::Info;
}

} // namespace

auto parse_log_options(int argc, char* argv[]) -> Result<LogConfig, std::string> {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            auto value = arg.substr(12);
            explicit_level = parse_level(value);
            if (!explicit_level) {
                return "unknown log level '" + std::string(value) + "'";
            }
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            auto value = arg.substr(13);
            if (value == "json") {
                config.format = LogFormat::JSON;
            } else if (value == "text") {
                config.format = LogFormat::Text;
            } else {
                return "unknown log format '" + std::string(value) + "'";
            }
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbosity = std::max(verbosity, 1);
        } else {
            verbosity = std::max(verbosity, verbosity_of(arg));
        }
    }

    if (explicit_level) {
        config.level = *explicit_level;
    } else if (verbosity > 0) {
        config.level = verbosity_level(verbosity);
    } else if (config.filter_spec.empty()) {
        const char* env = std::getenv("NOTATE_LOG");
        std::string_view spec = env != nullptr ? env : "";
        if (spec.find_first_of("=,") != std::string_view::npos) {
            config.filter_spec = spec;
        } else if (!spec.empty()) {
            auto level = parse_level(spec);
            if (!level) {
                return "NOTATE_LOG: unknown log level '" + std::string(spec) + "'";
            }
            config.level = *level;
        }
    }

    return config;
}

auto is_log_option(std::string_view arg) -> bool {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || verbosity_of(arg) > 0;
}

} // namespace notate::log
