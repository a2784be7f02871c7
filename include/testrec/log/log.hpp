//! # testrec Diagnostic Logging
//!
//! The recorder library reports what it notices while rendering (untracked
//! tests, ignored configuration values, failed system queries) through this
//! logger. Rendered event text is written by the host's write function and
//! never passes through here.
//!
//! Records carry a level and a module tag. A `LogFilter` decides per module
//! whether a record is kept, and the `Logger` singleton hands kept records to
//! its sinks. Nothing is printed until the host installs sinks, either with
//! `Logger::init(parse_log_options(argc, argv))` or `add_sink()`.
//!
//! ```cpp
//! TESTREC_LOG_DEBUG("recorder", "Test " << id << " ended without a start event");
//! TESTREC_LOG_WARN("options", "Ignoring tag color '" << text << "'");
//! ```
//!
//! Builds can drop low levels entirely by defining TESTREC_MIN_LOG_LEVEL.

#ifndef TESTREC_LOG_HPP
#define TESTREC_LOG_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace testrec::log {

// ============================================================================
// Severity
// ============================================================================

/// Ordered from most to least verbose. `Off` only appears as a threshold.
enum class LogLevel : int { Trace, Debug, Info, Warn, Error, Fatal, Off };

namespace detail {
inline constexpr std::array<const char*, 7> level_names = {"TRACE", "DEBUG", "INFO", "WARN",
                                                          "ERROR", "FATAL", "OFF"};
} // namespace detail

[[nodiscard]] constexpr auto level_name(LogLevel level) noexcept -> const char* {
    auto index = static_cast<size_t>(level);
    return index < detail::level_names.size() ? detail::level_names[index] : "???";
}

/// Case-insensitive lookup of a level name. Anything unknown reads as Info.
[[nodiscard]] auto parse_level(std::string_view text) -> LogLevel;

// ============================================================================
// Records and Formats
// ============================================================================

/// One diagnostic. `module` must point at storage that outlives the call to
/// `Logger::log`; the macros pass string literals.
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view module;
    std::string message;
    const char* file = nullptr;
    int line = 0;
    int64_t timestamp_ms = 0;
};

enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< {"ts":..,"level":..,"module":..,"msg":..}
};

/// Plain text line for `record`, without color or trailing newline.
[[nodiscard]] auto format_text(const LogRecord& record) -> std::string;

/// Single-line JSON object for `record`. Control characters in the message
/// are escaped.
[[nodiscard]] auto format_json(const LogRecord& record) -> std::string;

// ============================================================================
// Sinks
// ============================================================================

/// Destination for records the logger has accepted. The logger serializes
/// calls, so sinks need no locking of their own.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Shared base for sinks that emit one formatted line per record.
class FormattingSink : public LogSink {
public:
    void set_format(LogFormat format) {
        format_ = format;
    }

    [[nodiscard]] auto format() const -> LogFormat {
        return format_;
    }

protected:
    [[nodiscard]] auto render(const LogRecord& record) const -> std::string {
        return format_ == LogFormat::JSON ? format_json(record) : format_text(record);
    }

private:
    LogFormat format_ = LogFormat::Text;
};

/// stderr. The level name is colored when `colored` is set and stderr is a
/// color-capable terminal.
class ConsoleSink : public FormattingSink {
public:
    explicit ConsoleSink(bool colored = true);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colored_;
};

/// Log file, truncated or appended to. Error and Fatal records are flushed
/// immediately.
class FileSink : public FormattingSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return out_.is_open();
    }

private:
    std::ofstream out_;
};

class NullSink : public LogSink {
public:
    void write(const LogRecord&) override {}
    void flush() override {}
};

/// Forwards every record to each child in insertion order.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);
    void clear();

    [[nodiscard]] auto size() const -> size_t {
        return children_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> children_;
};

// ============================================================================
// Module Filter
// ============================================================================

/// Per-module thresholds, e.g. "recorder=trace,options=debug,*=warn".
///
/// `*=level` replaces the fallback threshold. A module named without a level
/// is opened up to Trace.
class LogFilter {
public:
    explicit LogFilter(LogLevel fallback = LogLevel::Info) : fallback_(fallback) {}

    /// Replaces all module thresholds with those in `spec`.
    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        fallback_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return fallback_;
    }

    /// Most verbose threshold across the fallback and every module.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    [[nodiscard]] auto threshold(std::string_view module) const -> LogLevel;

    LogLevel fallback_;
    std::map<std::string, LogLevel, std::less<>> modules_;
};

// ============================================================================
// Logger
// ============================================================================

/// What `Logger::init` installs. Produced by `parse_log_options`.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; // empty keeps every module at `level`
    std::string log_file;    // empty disables the file sink
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Every member is safe to call from any thread.
class Logger {
public:
    /// Discards the current sinks and filter and installs those described
    /// by `config`.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Checked by the macros before the message is built.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Sets the fallback threshold. Module overrides stay in place.
    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return floor_.load(std::memory_order_relaxed);
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    // Cheapest level any module accepts; lets should_log skip the lock.
    std::atomic<LogLevel> floor_{LogLevel::Warn};
    LogFilter filter_{LogLevel::Warn};
    MultiSink sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Reads --log-level=, --log-filter=, --log-file=, --log-format=, -v, -vv,
/// -vvv, --verbose, -q and --quiet from argv and ignores everything else.
/// The TESTREC_LOG environment variable is consulted only when argv sets
/// neither a level nor a filter.
[[nodiscard]] auto parse_log_options(int argc, char* argv[]) -> LogConfig;

// ============================================================================
// Macros
// ============================================================================

// Numeric value of the lowest LogLevel compiled in (Trace=0 ... Off=6).
#ifndef TESTREC_MIN_LOG_LEVEL
#define TESTREC_MIN_LOG_LEVEL 0
#endif

#define TESTREC_LOG_AT(lvl, module, msg)                                                           \
    do {                                                                                           \
        if constexpr (static_cast<int>(lvl) >= TESTREC_MIN_LOG_LEVEL) {                            \
            auto& testrec_logger_ = ::testrec::log::Logger::instance();                            \
            if (testrec_logger_.should_log(lvl, module)) {                                         \
                std::ostringstream testrec_text_;                                                  \
                testrec_text_ << msg;                                                              \
                testrec_logger_.log(lvl, module, testrec_text_.str(), __FILE__, __LINE__);         \
            }                                                                                      \
        }                                                                                          \
    } while (false)

#define TESTREC_LOG_TRACE(module, msg) TESTREC_LOG_AT(::testrec::log::LogLevel::Trace, module, msg)
#define TESTREC_LOG_DEBUG(module, msg) TESTREC_LOG_AT(::testrec::log::LogLevel::Debug, module, msg)
#define TESTREC_LOG_INFO(module, msg) TESTREC_LOG_AT(::testrec::log::LogLevel::Info, module, msg)
#define TESTREC_LOG_WARN(module, msg) TESTREC_LOG_AT(::testrec::log::LogLevel::Warn, module, msg)
#define TESTREC_LOG_ERROR(module, msg) TESTREC_LOG_AT(::testrec::log::LogLevel::Error, module, msg)
#define TESTREC_LOG_FATAL(module, msg) TESTREC_LOG_AT(::testrec::log::LogLevel::Fatal, module, msg)

} // namespace testrec::log

#endif // TESTREC_LOG_HPP
