#include "cli/utils.hpp"

#include "common.hpp"
#include "log/log.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace notate::cli {

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

Result<std::vector<std::string>, std::string> parse_command_flags(int argc, char* argv[]) {
    std::vector<std::string> operands;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--pretty") {
            NotateOptions::pretty_output = true;
        } else if (arg.starts_with("--diagnostic-format=")) {
            std::string format = arg.substr(20);
            if (format == "json") {
                NotateOptions::diagnostic_format = DiagnosticFormat::JSON;
            } else if (format == "text") {
                NotateOptions::diagnostic_format = DiagnosticFormat::Text;
            } else {
                return "unknown diagnostic format: " + format;
            }
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return "unknown option: " + arg;
        } else {
            operands.push_back(arg);
        }
    }
    return operands;
}

std::string format_diagnostic(const annotation::AnnotationError& error) {
    if (NotateOptions::diagnostic_format == DiagnosticFormat::JSON) {
        return error.to_json().to_string();
    }
    if (error.file.empty()) {
        return "error: " + error.message;
    }
    return error.file + ":" + std::to_string(error.line) + ": error: " + error.message;
}

void print_usage() {
    std::cout << "notate " << VERSION << "\n\n";
    std::cout << "Usage: notate <command> [options] [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  expand <manifest.json>   Expand class annotations into descriptors (JSON)\n";
    std::cout << "  parse <text|@file>       Show directives and their evaluated parameters\n";
    std::cout << "  list                     List registered annotation kinds\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h               Show this help\n";
    std::cout << "  --version, -V            Show version\n";
    std::cout << "  --pretty                 Indent JSON output\n";
    std::cout << "  --diagnostic-format=json Emit diagnostics as JSON lines\n";
    std::cout << "  --verbose, -v            Show detailed output (-vv, -vvv for more)\n";
    std::cout << "  --log-level=<level>      trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>      Per-module levels, e.g. evaluator=trace,*=warn\n";
    std::cout << "  --log-file=<path>        Also write log records to a file\n";
    std::cout << "  --log-format=json        Log records as JSON\n";
    std::cout << "  -q, --quiet              Only log errors\n";
}

void print_version() {
    std::cout << "notate " << VERSION << "\n";
}

} // namespace notate::cli
