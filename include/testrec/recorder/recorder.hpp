//! # Event Recorder
//!
//! Turns the event stream of a test run into human-readable lines:
//!
//! ```text
//! ◇ Test run started.
//! ↳ Testing Library Version: testrec 0.1.0
//! ◇ Test parse() started.
//! ✘ Test parse() recorded an issue at parser_test.cpp:42:7: Expectation failed: x == 1
//! ✘ Test parse() failed after 0.004 seconds with 1 issue.
//! ✘ Test run with 1 test failed after 0.005 seconds with 1 issue.
//! ```
//!
//! A Recorder may be fed from any number of threads at once. It updates its
//! `RecorderContext` under a lock, formats outside it, and hands every line
//! to the write function without serializing the writes.

#pragma once

#include "testrec/events/event.hpp"
#include "testrec/recorder/context.hpp"
#include "testrec/recorder/options.hpp"

#include <functional>
#include <optional>
#include <string>

namespace testrec::recorder {

/// Receives each rendered line, newline included.
using WriteFunction = std::function<void(const std::string&)>;

class Recorder {
public:
    Recorder(RecorderOptions options, WriteFunction write);

    /// The text for `event`, or nullopt for kinds that produce no output.
    /// Updates the run state as a side effect.
    [[nodiscard]] auto render(const events::Event& event, const events::EventContext& context)
        -> std::optional<std::string>;

    /// Renders `event` and passes the text to the write function. Returns
    /// whether anything was written.
    bool record(const events::Event& event, const events::EventContext& context);

    [[nodiscard]] auto options() const -> const RecorderOptions& {
        return options_;
    }

    [[nodiscard]] auto context() const -> const RecorderContext& {
        return context_;
    }

private:
    [[nodiscard]] auto test_name(const events::Test* test) const -> std::string;

    auto render_run_started(events::Instant instant) -> std::string;
    auto render_test_started(const events::Test* test, const std::string& name,
                             events::Instant instant) -> std::string;
    auto render_test_ended(const events::Test* test, const std::string& name,
                           events::Instant instant) -> std::string;
    auto render_test_skipped(const events::Test* test, const std::string& name,
                             const events::kind::TestSkipped& skip, events::Instant instant)
        -> std::string;
    auto render_issue(const events::EventContext& context, const std::string& name,
                      const events::Issue& issue, events::Instant instant) -> std::string;
    auto render_test_case_started(const events::EventContext& context, const std::string& name)
        -> std::optional<std::string>;
    auto render_run_ended(events::Instant instant) -> std::string;

    RecorderOptions options_;
    TagColorMap tag_colors_;
    WriteFunction write_;
    RecorderContext context_;
};

/// "<warning symbol> <message>", for advisories about the library itself
/// rather than about a test.
[[nodiscard]] auto warning(const std::string& message, const RecorderOptions& options)
    -> std::string;

} // namespace testrec::recorder
