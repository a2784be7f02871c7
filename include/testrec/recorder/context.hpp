//! # Recorder Context
//!
//! Mutable state a Recorder accumulates over a run: when the run started,
//! how many tests and suites were seen, and per-test issue counts.
//!
//! Per-test data lives in an ordered map keyed by the test's key path.
//! Key paths compare component by component, so every descendant of a test
//! sorts immediately after it and a subtree is one contiguous range of the
//! map:
//!
//! ```text
//! {Module, Suite}                 <- read_subtree(Suite) starts here
//! {Module, Suite, Nested}
//! {Module, Suite, Nested, a()}
//! {Module, Suite, b()}            <- and ends here
//! {Module, SuiteTwo}
//! ```
//!
//! Every operation takes the same mutex and holds it only long enough to
//! mutate or copy; callers format text from the returned snapshots.

#pragma once

#include "testrec/events/test.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace testrec::recorder {

/// Per-test counters.
struct TestData {
    events::Instant start_instant{};
    int issue_count = 0;
    int known_issue_count = 0;
    bool counted = false; // included in the test or suite count
};

/// A test's own data (if it was started) and the issue counts summed over
/// the test and everything nested inside it.
struct SubtreeSnapshot {
    std::optional<TestData> root;
    int issue_count = 0;
    int known_issue_count = 0;
};

/// Run-level totals.
struct RunSnapshot {
    std::optional<events::Instant> run_start_instant;
    int test_count = 0;
    int suite_count = 0;
    int issue_count = 0;
    int known_issue_count = 0;
};

/// Thread-safe aggregation of run state.
class RecorderContext {
public:
    void record_run_start(events::Instant instant);

    /// Starts tracking `id` at `instant` and counts it as a test or suite.
    /// Each identity is counted once: returns false, and changes nothing,
    /// if `id` was already counted by an earlier start or skip. An entry
    /// created earlier by an issue keeps its start instant but is counted.
    bool observe(const events::TestId& id, events::Instant instant, bool is_suite);

    /// Bumps the issue or known-issue counter of `id`. Returns false if `id`
    /// was not tracked yet, in which case an entry starting at `instant` is
    /// created first.
    bool increment_issue(const events::TestId& id, bool known, events::Instant instant);

    [[nodiscard]] auto read_subtree(const events::TestId& id) const -> SubtreeSnapshot;

    [[nodiscard]] auto read_all() const -> RunSnapshot;

    /// Number of tracked tests and suites.
    [[nodiscard]] auto entry_count() const -> size_t;

private:
    mutable std::mutex mutex_;
    std::optional<events::Instant> run_start_instant_;
    int test_count_ = 0;
    int suite_count_ = 0;
    std::map<std::vector<std::string>, TestData> test_data_;
};

} // namespace testrec::recorder
