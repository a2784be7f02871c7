//! # Logger Implementation

#include "testrec/log/log.hpp"
#include "testrec/terminal.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace testrec::log {

namespace {

auto now_epoch_ms() -> int64_t {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

/// Local wall-clock time of `epoch_ms` as "HH:MM:SS.mmm".
auto clock_time(int64_t epoch_ms) -> std::string {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min,
                  local.tm_sec, static_cast<int>(epoch_ms % 1000));
    return buf;
}

/// Level name padded to the width of the longest one.
auto padded_level(LogLevel level) -> std::string {
    std::string name = level_name(level);
    name.resize(5, ' ');
    return name;
}

auto level_sgr(LogLevel level) -> std::string_view {
    constexpr std::array<std::string_view, 6> codes = {"\033[90m", "\033[36m", "\033[32m",
                                                       "\033[33m", "\033[31m", "\033[1;31m"};
    auto index = static_cast<size_t>(level);
    return index < codes.size() ? codes[index] : std::string_view{};
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
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
}

} // namespace

// ============================================================================
// Levels and Formats
// ============================================================================

auto parse_level(std::string_view text) -> LogLevel {
    std::string upper(text);
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    for (size_t i = 0; i < detail::level_names.size(); ++i) {
        if (upper == detail::level_names[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

auto format_text(const LogRecord& record) -> std::string {
    std::string line = clock_time(record.timestamp_ms);
    line += ' ';
    line += padded_level(record.level);
    line += " [";
    line += record.module;
    line += "] ";
    line += record.message;
    return line;
}

auto format_json(const LogRecord& record) -> std::string {
    std::string out = "{\"ts\":" + std::to_string(record.timestamp_ms);
    out += ",\"level\":\"";
    out += level_name(record.level);
    out += "\",\"module\":\"";
    append_json_escaped(out, record.module);
    out += "\",\"msg\":\"";
    append_json_escaped(out, record.message);
    out += "\"}";
    return out;
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool colored)
    : colored_(colored && terminal_supports_colors(stderr)) {}

void ConsoleSink::write(const LogRecord& record) {
    if (format() == LogFormat::JSON || !colored_) {
        std::cerr << render(record) << '\n';
        return;
    }
    // Only the level name is colored
    std::cerr << clock_time(record.timestamp_ms) << ' ' << level_sgr(record.level)
              << padded_level(record.level) << "\033[0m [" << record.module << "] "
              << record.message << '\n';
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : out_(path, append ? std::ios::app : std::ios::trunc) {}

void FileSink::write(const LogRecord& record) {
    if (!out_.is_open()) {
        return;
    }
    out_ << render(record) << '\n';
    if (record.level >= LogLevel::Error) {
        out_.flush();
    }
}

void FileSink::flush() {
    if (out_.is_open()) {
        out_.flush();
    }
}

void MultiSink::write(const LogRecord& record) {
    for (const auto& child : children_) {
        child->write(record);
    }
}

void MultiSink::flush() {
    for (const auto& child : children_) {
        child->flush();
    }
}

void MultiSink::add(std::unique_ptr<LogSink> sink) {
    if (sink) {
        children_.push_back(std::move(sink));
    }
}

void MultiSink::clear() {
    children_.clear();
}

// ============================================================================
// Module Filter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    modules_.clear();

    while (!spec.empty()) {
        size_t comma = spec.find(',');
        std::string_view entry = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }
        size_t eq = entry.find('=');
        if (eq == std::string_view::npos) {
            modules_[std::string(entry)] = LogLevel::Trace;
            continue;
        }
        std::string_view module = entry.substr(0, eq);
        LogLevel level = parse_level(entry.substr(eq + 1));
        if (module == "*") {
            fallback_ = level;
        } else {
            modules_[std::string(module)] = level;
        }
    }
}

auto LogFilter::threshold(std::string_view module) const -> LogLevel {
    auto it = modules_.find(module);
    return it == modules_.end() ? fallback_ : it->second;
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    return level != LogLevel::Off && level >= threshold(module);
}

auto LogFilter::min_level() const -> LogLevel {
    LogLevel lowest = fallback_;
    for (const auto& entry : modules_) {
        lowest = std::min(lowest, entry.second);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    bool file_failed = false;
    {
        std::lock_guard<std::mutex> lock(logger.mutex_);

        logger.filter_ = LogFilter(config.level);
        logger.filter_.parse(config.filter_spec);
        logger.floor_ = logger.filter_.min_level();

        logger.sinks_.clear();
        if (config.console) {
            auto console = std::make_unique<ConsoleSink>(config.colors);
            console->set_format(config.format);
            logger.sinks_.add(std::move(console));
        }
        if (!config.log_file.empty()) {
            auto file = std::make_unique<FileSink>(config.log_file);
            file->set_format(config.format);
            if (file->is_open()) {
                logger.sinks_.add(std::move(file));
            } else {
                file_failed = true;
            }
        }
    }

    if (file_failed) {
        TESTREC_LOG_WARN("log", "Could not open log file '" << config.log_file << "'");
    }
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    if (level < floor_.load(std::memory_order_relaxed)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.write(record);
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{level, module, message, file, line, now_epoch_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.add(std::move(sink));
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.set_default_level(level);
    floor_ = filter_.min_level();
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    floor_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.flush();
}

} // namespace testrec::log
