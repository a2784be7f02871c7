//! # Text Formatting Helpers
//!
//! Durations, counted nouns, issue-count suffixes, comment blocks and
//! labeled argument lists.

#pragma once

#include "testrec/events/test.hpp"
#include "testrec/recorder/options.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace testrec::recorder {

// ============================================================================
// Durations and Counts
// ============================================================================

/// Elapsed time from `start` to `end` as "<seconds>.<millis> seconds".
/// Never negative: an `end` before `start` formats as zero.
[[nodiscard]] auto format_duration(events::Instant start, events::Instant end) -> std::string;

/// "1 test", "0 tests", "2 issues".
[[nodiscard]] auto counting(int count, std::string_view noun) -> std::string;

/// The " with ..." clause appended to pass/fail lines.
///
/// | issues | known | result                                         |
/// |--------|-------|------------------------------------------------|
/// | 0      | 0     | ""                                             |
/// | 3      | 0     | " with 3 issues"                               |
/// | 0      | 1     | " with 1 known issue"                          |
/// | 2      | 1     | " with 3 issues (including 1 known issue)"     |
[[nodiscard]] auto issue_suffix(int issue_count, int known_issue_count) -> std::string;

// ============================================================================
// Comments and Arguments
// ============================================================================

/// Each comment's first line behind an arrow, continuation lines indented
/// two spaces, all joined by newlines and dimmed under ANSI. nullopt when
/// `comments` is empty.
[[nodiscard]] auto format_comments(const std::vector<events::Comment>& comments,
                                   const RecorderOptions& options) -> std::optional<std::string>;

/// "label → value, ..." pairing arguments with parameters by position.
/// Parameters labeled "_" show the value alone.
[[nodiscard]] auto labeled_arguments(const events::TestCase& test_case,
                                     const std::vector<events::Parameter>& parameters)
    -> std::string;

} // namespace testrec::recorder
