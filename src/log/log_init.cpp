//! # Logging Options
//!
//! Builds a LogConfig from argv and, failing that, from TESTREC_LOG.

#include "testrec/log/log.hpp"
#include "testrec/terminal.hpp"

#include <algorithm>
#include <optional>
#include <string>

namespace testrec::log {

namespace {

/// Value after `--name=` when `arg` is that flag.
auto flag_value(std::string_view arg, std::string_view name) -> std::optional<std::string_view> {
    if (arg.size() > name.size() && arg.starts_with(name) && arg[name.size()] == '=') {
        return arg.substr(name.size() + 1);
    }
    return std::nullopt;
}

/// Number of 'v' characters in "-v", "-vv", ... or 0 when `arg` is not one.
auto verbosity(std::string_view arg) -> int {
    if (arg.size() < 2 || arg.front() != '-') {
        return 0;
    }
    std::string_view letters = arg.substr(1);
    bool all_v = std::all_of(letters.begin(), letters.end(), [](char c) { return c == 'v'; });
    return all_v ? static_cast<int>(letters.size()) : 0;
}

auto verbosity_level(int count) -> LogLevel {
    switch (count) {
    case 1:
        return LogLevel::Info;
    case 2:
        return LogLevel::Debug;
    default:
        return LogLevel::Trace;
    }
}

/// TESTREC_LOG holds either a bare level ("debug") or a filter
/// ("recorder=trace,*=warn", "recorder,options").
void apply_environment(LogConfig& config) {
    std::string value = get_env("TESTREC_LOG");
    if (value.empty()) {
        return;
    }
    if (value.find_first_of("=,") != std::string::npos) {
        config.filter_spec = value;
    } else {
        config.level = parse_level(value);
    }
}

} // namespace

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    int verbose = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (auto level = flag_value(arg, "--log-level")) {
            explicit_level = parse_level(*level);
        } else if (auto filter = flag_value(arg, "--log-filter")) {
            config.filter_spec = std::string(*filter);
        } else if (auto file = flag_value(arg, "--log-file")) {
            config.log_file = std::string(*file);
        } else if (auto format = flag_value(arg, "--log-format")) {
            bool json = *format == "json" || *format == "JSON";
            config.format = json ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbose = std::max(verbose, 1);
        } else {
            verbose = std::max(verbose, verbosity(arg));
        }
    }

    // --log-level and -q win over -v regardless of order
    if (explicit_level) {
        config.level = *explicit_level;
    } else if (verbose > 0) {
        config.level = verbosity_level(verbose);
    } else if (config.filter_spec.empty()) {
        apply_environment(config);
    }

    return config;
}

} // namespace testrec::log
