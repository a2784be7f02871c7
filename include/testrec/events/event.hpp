//! # Events
//!
//! The closed set of lifecycle notifications a test engine emits while it
//! runs, and the context that travels with each one.
//!
//! | Kind                 | Test context | Notes                          |
//! |----------------------|--------------|--------------------------------|
//! | `RunStarted`         | none         |                                |
//! | `PlanStepStarted`    | test         | planning detail                |
//! | `TestStarted`        | test         | suites too                     |
//! | `TestCaseStarted`    | test, case   | one per argument set           |
//! | `ExpectationChecked` | test, case   | every `expect`                 |
//! | `IssueRecorded`      | test, case   | test may be absent             |
//! | `TestCaseEnded`      | test, case   |                                |
//! | `TestSkipped`        | test         | instead of started/ended       |
//! | `TestBypassed`       | test         | superseded by `TestSkipped`    |
//! | `TestEnded`          | test         |                                |
//! | `PlanStepEnded`      | test         | planning detail                |
//! | `RunEnded`           | none         |                                |

#pragma once

#include "testrec/events/test.hpp"

#include <optional>
#include <variant>

namespace testrec::events {

// ============================================================================
// Event Kinds
// ============================================================================

namespace kind {

struct RunStarted {};
struct RunEnded {};
struct PlanStepStarted {};
struct PlanStepEnded {};
struct TestStarted {};
struct TestEnded {};

struct TestSkipped {
    std::optional<Comment> comment;
};

/// Older spelling of TestSkipped that engines may still emit.
struct TestBypassed {
    std::optional<Comment> comment;
};

struct ExpectationChecked {
    bool passed = true;
};

struct IssueRecorded {
    Issue issue;
};

struct TestCaseStarted {};
struct TestCaseEnded {};

} // namespace kind

using EventKind =
    std::variant<kind::RunStarted, kind::RunEnded, kind::PlanStepStarted, kind::PlanStepEnded,
                 kind::TestStarted, kind::TestEnded, kind::TestSkipped, kind::TestBypassed,
                 kind::ExpectationChecked, kind::IssueRecorded, kind::TestCaseStarted,
                 kind::TestCaseEnded>;

/// Short name of an event kind ("testStarted", "issueRecorded", ...).
[[nodiscard]] auto event_kind_name(const EventKind& kind) -> const char*;

// ============================================================================
// Event and Context
// ============================================================================

/// One lifecycle notification.
struct Event {
    EventKind kind;
    Instant instant = Clock::now();
};

/// Engine-owned state describing where an event happened. Pointers are
/// borrowed for the duration of a single render call.
struct EventContext {
    const Test* test = nullptr;
    const TestCase* test_case = nullptr;
};

} // namespace testrec::events
