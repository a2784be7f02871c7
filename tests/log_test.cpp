//! # Logger Unit Tests
//!
//! LogFilter parsing, record formatting, FileSink I/O, the Logger singleton
//! with its macros, and argv/environment parsing of log options.

#include "testrec/log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace testrec::log;
namespace fs = std::filesystem;

namespace {

void set_env(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value ? value : "");
#else
    if (value) {
        setenv(name, value, 1);
    } else {
        unsetenv(name);
    }
#endif
}

/// Owns argument strings and exposes them as a mutable argv.
struct Args {
    explicit Args(std::vector<std::string> args) : storage(std::move(args)) {
        storage.insert(storage.begin(), "testrec");
        for (auto& arg : storage) {
            pointers.push_back(arg.data());
        }
        pointers.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage.size());
    }
    char** argv() {
        return pointers.data();
    }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

} // namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("recorder=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "recorder"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "recorder"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "recorder"));

    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "options"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "options"));
}

TEST_F(LogFilterTest, BareModuleNameEnablesTrace) {
    filter.parse("options");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "options"));
    // Untouched default
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "recorder"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("recorder=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "recorder"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "environment"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("recorder=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilterUsesInfo) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

TEST(LogLevelTest, ParseLevelNames) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("Loud"), LogLevel::Info);
}

TEST(LogLevelTest, ParseIgnoresCase) {
    EXPECT_EQ(parse_level("Warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("eRrOr"), LogLevel::Error);
}

TEST(LogLevelTest, Names) {
    static_assert(level_name(LogLevel::Trace)[0] == 'T');
    EXPECT_STREQ(level_name(LogLevel::Info), "INFO");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
}

// ============================================================================
// Record Formatting
// ============================================================================

namespace {

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 1234567890;
    return record;
}

} // namespace

TEST(LogFormatTest, TextContainsLevelAndModule) {
    std::string text = format_text(make_record(LogLevel::Warn, "options", "bad flag"));

    EXPECT_NE(text.find("WARN"), std::string::npos);
    EXPECT_NE(text.find("[options] bad flag"), std::string::npos);
}

TEST(LogFormatTest, JsonEscapesMessage) {
    std::string json =
        format_json(make_record(LogLevel::Debug, "recorder", "say \"hi\"\n\x1b[0m"));

    EXPECT_NE(json.find("\"ts\":1234567890"), std::string::npos);
    EXPECT_NE(json.find("\"level\":\"DEBUG\""), std::string::npos);
    EXPECT_NE(json.find("\"module\":\"recorder\""), std::string::npos);
    EXPECT_NE(json.find("say \\\"hi\\\"\\n\\u001b[0m"), std::string::npos);
    EXPECT_EQ(json.find('\x1b'), std::string::npos);
}

TEST(LogFormatTest, JsonEscapesEveryControlCharacter) {
    std::string json = format_json(make_record(LogLevel::Info, "recorder", "a\x01" "b\tc"));
    EXPECT_NE(json.find("a\\u0001b\\tc"), std::string::npos);
}

// ============================================================================
// In-memory sink
// ============================================================================

class RecordingSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex);
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {
        flushed = true;
    }

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::mutex mutex;
    std::vector<Entry> records;
    bool flushed = false;
};

// ============================================================================
// FileSink and MultiSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "testrec_log_test.log";
        fs::remove(temp_file);
    }

    void TearDown() override {
        fs::remove(temp_file);
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "recorder", "file sink test"));
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
    EXPECT_NE(content.find("[recorder]"), std::string::npos);
}

TEST_F(FileSinkTest, AppendKeepsEarlierRecords) {
    {
        FileSink sink(temp_file.string(), false);
        sink.write(make_record(LogLevel::Info, "recorder", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "recorder", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormat) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "options", "json line"));
    }

    std::string content = read_file(temp_file);
    EXPECT_EQ(content.rfind("{\"ts\":", 0), 0u);
    EXPECT_NE(content.find("\"msg\":\"json line\""), std::string::npos);
}

TEST(MultiSinkTest, FansOutToEveryChild) {
    auto first = std::make_unique<RecordingSink>();
    auto second = std::make_unique<RecordingSink>();
    RecordingSink* first_ptr = first.get();
    RecordingSink* second_ptr = second.get();

    MultiSink multi;
    multi.add(std::move(first));
    multi.add(std::move(second));
    multi.add(std::make_unique<NullSink>());
    EXPECT_EQ(multi.size(), 3u);

    multi.write(make_record(LogLevel::Info, "recorder", "fan out"));
    multi.flush();

    ASSERT_EQ(first_ptr->records.size(), 1u);
    ASSERT_EQ(second_ptr->records.size(), 1u);
    EXPECT_EQ(second_ptr->records[0].message, "fan out");
    EXPECT_TRUE(first_ptr->flushed);

    multi.clear();
    EXPECT_EQ(multi.size(), 0u);
    multi.write(make_record(LogLevel::Info, "recorder", "nobody listens"));
}

// ============================================================================
// Logger Singleton and Macros
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    RecordingSink* capture = nullptr;

    void SetUp() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Info;
        Logger::init(config);

        auto sink = std::make_unique<RecordingSink>();
        capture = sink.get();
        Logger::instance().add_sink(std::move(sink));
    }

    void TearDown() override {
        LogConfig config;
        config.console = false;
        Logger::init(config);
    }
};

TEST_F(LoggerTest, MacrosRespectLevel) {
    TESTREC_LOG_DEBUG("recorder", "hidden " << 1);
    TESTREC_LOG_INFO("recorder", "shown " << 2);
    TESTREC_LOG_ERROR("options", "also shown");

    ASSERT_EQ(capture->records.size(), 2u);
    EXPECT_EQ(capture->records[0].level, LogLevel::Info);
    EXPECT_EQ(capture->records[0].module, "recorder");
    EXPECT_EQ(capture->records[0].message, "shown 2");
    EXPECT_EQ(capture->records[1].module, "options");
}

TEST_F(LoggerTest, FilterLowersOneModule) {
    Logger::instance().set_filter("recorder=trace,*=warn");

    TESTREC_LOG_TRACE("recorder", "trace from recorder");
    TESTREC_LOG_INFO("options", "info from options");

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].message, "trace from recorder");
}

TEST_F(LoggerTest, SetLevelRaisesFloor) {
    Logger::instance().set_level(LogLevel::Error);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Error);

    TESTREC_LOG_WARN("recorder", "dropped");
    EXPECT_TRUE(capture->records.empty());
}

TEST_F(LoggerTest, SetLevelKeepsModuleOverrides) {
    Logger::instance().set_filter("recorder=debug,*=warn");
    Logger::instance().set_level(LogLevel::Error);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);

    TESTREC_LOG_DEBUG("recorder", "kept");
    TESTREC_LOG_WARN("options", "dropped");

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].message, "kept");
}

TEST_F(LoggerTest, ConcurrentLoggingKeepsEveryRecord) {
    constexpr int thread_count = 8;
    constexpr int per_thread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < per_thread; ++i) {
                TESTREC_LOG_INFO("recorder", "thread " << t << " message " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(capture->records.size(), static_cast<size_t>(thread_count * per_thread));
}

TEST_F(LoggerTest, FlushReachesSinks) {
    Logger::instance().flush();
    EXPECT_TRUE(capture->flushed);
}

// ============================================================================
// Option Parsing
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_env("TESTREC_LOG", nullptr);
    }
    void TearDown() override {
        set_env("TESTREC_LOG", nullptr);
    }
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    Args args({});
    LogConfig config = parse_log_options(args.argc(), args.argv());

    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::Text);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
}

TEST_F(LogOptionsTest, ExplicitFlags) {
    Args args({"--log-level=debug", "--log-filter=recorder=trace", "--log-file=out.log",
               "--log-format=json", "--color=never"});
    LogConfig config = parse_log_options(args.argc(), args.argv());

    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "recorder=trace");
    EXPECT_EQ(config.log_file, "out.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    Args one({"-v"});
    EXPECT_EQ(parse_log_options(one.argc(), one.argv()).level, LogLevel::Info);

    Args two({"-vv"});
    EXPECT_EQ(parse_log_options(two.argc(), two.argv()).level, LogLevel::Debug);

    Args three({"-vvv"});
    EXPECT_EQ(parse_log_options(three.argc(), three.argv()).level, LogLevel::Trace);
}

TEST_F(LogOptionsTest, ExplicitLevelBeatsVerbosity) {
    Args args({"-vvv", "--log-level=error"});
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, QuietMeansError) {
    Args args({"-q"});
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, EnvironmentLevel) {
    set_env("TESTREC_LOG", "trace");
    Args args({});
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).level, LogLevel::Trace);
}

TEST_F(LogOptionsTest, EnvironmentFilter) {
    set_env("TESTREC_LOG", "recorder=debug,*=error");
    Args args({});
    LogConfig config = parse_log_options(args.argc(), args.argv());

    EXPECT_EQ(config.filter_spec, "recorder=debug,*=error");
    EXPECT_EQ(config.level, LogLevel::Warn);
}

TEST_F(LogOptionsTest, CommandLineOverridesEnvironment) {
    set_env("TESTREC_LOG", "trace");
    Args args({"--log-level=info"});
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).level, LogLevel::Info);
}
