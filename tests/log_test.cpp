//! # Logger Unit Tests
//!
//! Tests for the notate logging system: LogFilter parsing, FileSink I/O,
//! JSON output, CLI option parsing, and the log records emitted while
//! expanding annotations.

#include "annotation/expander.hpp"
#include "annotation/registry.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace notate::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndFallback) {
    EXPECT_TRUE(filter.parse("evaluator=debug,*=info").empty());

    EXPECT_TRUE(filter.allows(LogLevel::Debug, "evaluator"));
    EXPECT_TRUE(filter.allows(LogLevel::Error, "evaluator"));
    EXPECT_FALSE(filter.allows(LogLevel::Trace, "evaluator"));

    // Unlisted modules use the fallback
    EXPECT_TRUE(filter.allows(LogLevel::Info, "registry"));
    EXPECT_FALSE(filter.allows(LogLevel::Debug, "registry"));
}

TEST_F(LogFilterTest, BareModuleEnablesTrace) {
    filter.parse("expand");

    EXPECT_TRUE(filter.allows(LogLevel::Trace, "expand"));
    EXPECT_FALSE(filter.allows(LogLevel::Info, "cli"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("directive=off");

    EXPECT_FALSE(filter.allows(LogLevel::Fatal, "directive"));
    EXPECT_TRUE(filter.allows(LogLevel::Warn, "expand"));
}

TEST_F(LogFilterTest, ThresholdIsLowestLevel) {
    filter.parse("registry=trace,*=warn");
    EXPECT_EQ(filter.threshold(), LogLevel::Trace);
}

TEST_F(LogFilterTest, DefaultsToWarn) {
    EXPECT_TRUE(filter.allows(LogLevel::Warn, "cli"));
    EXPECT_FALSE(filter.allows(LogLevel::Info, "cli"));
}

TEST_F(LogFilterTest, ReportsUnknownModulesAndLevels) {
    auto problems = filter.parse("evalutor=debug,registry=loud,expand=info");

    ASSERT_EQ(problems.size(), 2u);
    EXPECT_EQ(problems[0], "unknown log module 'evalutor'");
    EXPECT_EQ(problems[1], "unknown log level 'loud' for 'registry'");

    // Valid entries still apply
    EXPECT_TRUE(filter.allows(LogLevel::Info, "expand"));
    EXPECT_TRUE(filter.allows(LogLevel::Debug, "evalutor"));
}

TEST(LogLevelHelpersTest, ParseLevel) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(parse_level("Off"), LogLevel::Off);
    EXPECT_FALSE(parse_level("nonsense").has_value());
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

TEST(LogLevelHelpersTest, KnownModules) {
    for (auto module : MODULES) {
        EXPECT_TRUE(is_known_module(module));
    }
    EXPECT_FALSE(is_known_module("codegen"));
}

// ============================================================================
// Helper: Capture sink that stores records in memory
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::vector<Entry> records;
};

/// Routes the global logger into a CaptureSink for the duration of a test.
class CapturedLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        auto sink = std::make_unique<CaptureSink>();
        capture = sink.get();
        logger.add_sink(std::move(sink));
    }

    void TearDown() override {
        LogConfig config;
        config.colors = false;
        Logger::init(config);
    }

    CaptureSink* capture = nullptr;
};

TEST_F(CapturedLoggerTest, MacroRespectsLevel) {
    Logger::instance().set_level(LogLevel::Info);

    NOTATE_LOG_DEBUG("cli", "hidden");
    NOTATE_LOG_INFO("cli", "shown " << 42);

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].level, LogLevel::Info);
    EXPECT_EQ(capture->records[0].module, "cli");
    EXPECT_EQ(capture->records[0].message, "shown 42");
}

TEST_F(CapturedLoggerTest, UnknownAnnotationIsWarned) {
    Logger::instance().set_level(LogLevel::Warn);

    notate::annotation::AnnotationRegistry registry;
    registry.seal();
    notate::annotation::StaticClassHierarchy hierarchy;
    notate::annotation::Expander expander(registry, hierarchy);

    notate::annotation::Element element;
    element.target.kind = notate::annotation::TargetKind::Class;
    element.target.class_name = "User";
    element.target.element_name = "User";
    element.comment = "/** !Bogus x */";

    notate::descriptor::ClassDescriptor descriptor("User");
    auto report = expander.expand_element(element, descriptor);

    EXPECT_EQ(report.errors.size(), 1u);
    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].level, LogLevel::Warn);
    EXPECT_EQ(capture->records[0].module, "expand");
    EXPECT_NE(capture->records[0].message.find("Unknown annotation: \"Bogus\""),
              std::string::npos);
}

TEST_F(CapturedLoggerTest, ModuleFilterSelectsRecords) {
    Logger::instance().set_filter("registry=trace,*=off");

    notate::annotation::AnnotationRegistry registry;
    EXPECT_FALSE(
        registry.add("Blank", [] { return notate::Box<notate::annotation::Annotation>(); }));
    NOTATE_LOG_ERROR("expand", "filtered out");

    ASSERT_FALSE(capture->records.empty());
    for (const auto& record : capture->records) {
        EXPECT_EQ(record.module, "registry");
    }
}

TEST_F(CapturedLoggerTest, RegisteringIntoSealedRegistryIsAnError) {
    Logger::instance().set_level(LogLevel::Error);

    notate::annotation::AnnotationRegistry registry;
    registry.seal();
    EXPECT_FALSE(registry.add("Late", [] { return notate::Box<notate::annotation::Annotation>(); }));

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].level, LogLevel::Error);
    EXPECT_EQ(capture->records[0].message, "Cannot register LateAnnotation: registry is sealed");
}

TEST_F(CapturedLoggerTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t, messages_per_thread]() {
            for (int i = 0; i < messages_per_thread; i++) {
                std::ostringstream oss;
                oss << "thread-" << t << "-msg-" << i;
                logger.log(LogLevel::Info, "expand", oss.str(), __FILE__, __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture->records.size()), num_threads * messages_per_thread);
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "notate_log_test.log";
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void TearDown() override {
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return content;
    }

    static LogRecord make_record(LogLevel level, std::string_view module, std::string message) {
        LogRecord record;
        record.level = level;
        record.module = module;
        record.message = std::move(message);
        record.file = __FILE__;
        record.line = __LINE__;
        record.timestamp_ms = 12345;
        return record;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), LogFormat::Text, false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "expand", "file sink test"));
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[expand]"), std::string::npos);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string());
        sink.write(make_record(LogLevel::Info, "cli", "first"));
    }
    {
        FileSink sink(temp_file.string());
        sink.write(make_record(LogLevel::Warn, "cli", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonEscapesSpecialCharacters) {
    {
        FileSink sink(temp_file.string(), LogFormat::JSON, false);
        sink.write(make_record(LogLevel::Error, "evaluator",
                               "line1\nline2\ttab\"quote\\backslash"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("\"ts\":12345"), std::string::npos);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"evaluator\""), std::string::npos);
    EXPECT_NE(content.find("line1\\nline2\\ttab\\\"quote\\\\backslash"), std::string::npos);
}

// ============================================================================
// CLI Option Parsing
// ============================================================================

namespace {

auto parse_args(std::vector<std::string> args) -> notate::Result<LogConfig, std::string> {
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_log_options(static_cast<int>(argv.size()), argv.data());
}

auto config_of(std::vector<std::string> args) -> LogConfig {
    auto result = parse_args(std::move(args));
    EXPECT_TRUE(notate::is_ok(result));
    return notate::is_ok(result) ? notate::unwrap(result) : LogConfig{};
}

} // namespace

TEST(LogOptionsTest, LevelFlag) {
    auto config = config_of({"notate", "list", "--log-level=warn"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
}

TEST(LogOptionsTest, ExplicitOptions) {
    auto config = config_of({"notate", "expand", "m.json", "--log-level=debug",
                              "--log-filter=expand=trace", "--log-format=json",
                              "--log-file=/tmp/notate.log"});

    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "expand=trace");
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_EQ(config.log_file, "/tmp/notate.log");
}

TEST(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(config_of({"notate", "list", "-v"}).level, LogLevel::Info);
    EXPECT_EQ(config_of({"notate", "list", "-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(config_of({"notate", "list", "-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(config_of({"notate", "list", "-vvv", "--quiet"}).level, LogLevel::Error);
}

TEST(LogOptionsTest, RejectsUnknownValues) {
    auto level = parse_args({"notate", "list", "--log-level=loud"});
    ASSERT_TRUE(notate::is_err(level));
    EXPECT_EQ(notate::unwrap_err(level), "unknown log level 'loud'");

    auto format = parse_args({"notate", "list", "--log-format=xml"});
    ASSERT_TRUE(notate::is_err(format));
    EXPECT_EQ(notate::unwrap_err(format), "unknown log format 'xml'");
}

TEST(LogOptionsTest, RecognizesOwnFlags) {
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_TRUE(is_log_option("--log-filter=cli=debug"));
    EXPECT_TRUE(is_log_option("--log-file=x.log"));
    EXPECT_TRUE(is_log_option("--log-format=json"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_TRUE(is_log_option("--verbose"));
    EXPECT_TRUE(is_log_option("-vvv"));

    EXPECT_FALSE(is_log_option("--prety"));
    EXPECT_FALSE(is_log_option("--log-levle=info"));
    EXPECT_FALSE(is_log_option("-vx"));
    EXPECT_FALSE(is_log_option("-"));
}

TEST(LogFormatTest, TextLine) {
    LogRecord record;
    record.level = LogLevel::Warn;
    record.module = "expand";
    record.message = "Invalid RouteAnnotation";
    record.timestamp_ms = 0;

    auto line = format_record(record, LogFormat::Text);
    EXPECT_NE(line.find(" WARN  [expand] Invalid RouteAnnotation"), std::string::npos);
}

TEST(LogFormatTest, JsonLine) {
    LogRecord record;
    record.level = LogLevel::Info;
    record.module = "cli";
    record.message = "2 annotation error(s)";
    record.timestamp_ms = 42;

    EXPECT_EQ(format_record(record, LogFormat::JSON),
              R"j({"level":"INFO","module":"cli","msg":"2 annotation error(s)","ts":42})j");
}
