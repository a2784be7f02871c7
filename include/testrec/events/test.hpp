//! # Test Model
//!
//! The data the test engine hands to the recorder alongside each event:
//! test identities, tests, parameterized test cases, tags and their colors,
//! comments, issues and source locations.
//!
//! These types carry data only. Discovering and running tests is the
//! engine's job; the recorder reads these values and never mutates them.
//!
//! ## Test identity
//!
//! A `TestId` is a key path. Suites nest, so the id of a test function is
//! its suite's id plus one more component:
//!
//! ```text
//! ["MathTests"]                          suite
//! ["MathTests", "Addition"]              nested suite
//! ["MathTests", "Addition", "adds()"]    test function
//! ```

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace testrec::events {

// ============================================================================
// Time
// ============================================================================

/// Monotonic clock used for every event instant.
using Clock = std::chrono::steady_clock;

/// A point on the test clock.
using Instant = Clock::time_point;

// ============================================================================
// Source Locations and Comments
// ============================================================================

/// Where something happened in a test's source code.
struct SourceLocation {
    std::string file_path;
    uint32_t line = 0;
    uint32_t column = 0;

    /// "<file name>:<line>:<column>", using only the last path component.
    [[nodiscard]] auto description() const -> std::string;

    bool operator==(const SourceLocation&) const = default;
};

/// A free-text comment attached to a test, an issue, or a skip.
struct Comment {
    std::string text;

    bool operator==(const Comment&) const = default;
};

// ============================================================================
// Test Identity
// ============================================================================

/// Hierarchical identity of a test or suite.
class TestId {
public:
    TestId() = default;
    explicit TestId(std::vector<std::string> key_path) : key_path_(std::move(key_path)) {}

    [[nodiscard]] auto key_path() const -> const std::vector<std::string>& {
        return key_path_;
    }

    /// The id of a test or suite nested directly inside this one.
    [[nodiscard]] auto child(std::string component) const -> TestId;

    /// The enclosing suite's id, or nullopt at the root.
    [[nodiscard]] auto parent() const -> std::optional<TestId>;

    /// True if `other` is nested (at any depth) inside this id.
    [[nodiscard]] auto is_ancestor_of(const TestId& other) const -> bool;

    /// Components joined with '/'.
    [[nodiscard]] auto description() const -> std::string;

    auto operator<=>(const TestId&) const = default;

private:
    std::vector<std::string> key_path_;
};

// ============================================================================
// Tags
// ============================================================================

/// A user-assigned label on a test.
///
/// `source_code` is the spelling the tag was written with (for instance
/// ".critical"), when the engine knows it. Tag colors may be keyed on either
/// spelling. Comparison only looks at `value`.
struct Tag {
    std::string value;
    std::optional<std::string> source_code;

    bool operator==(const Tag& other) const {
        return value == other.value;
    }
    auto operator<=>(const Tag& other) const -> std::strong_ordering {
        return value <=> other.value;
    }
};

/// An RGB color assigned to a tag. Ordered by (red, green, blue).
struct TagColor {
    uint8_t red = 0;
    uint8_t green = 0;
    uint8_t blue = 0;

    static constexpr auto rgb(uint8_t r, uint8_t g, uint8_t b) -> TagColor {
        return TagColor{r, g, b};
    }

    static constexpr auto named_red() -> TagColor {
        return rgb(255, 0, 0);
    }
    static constexpr auto named_orange() -> TagColor {
        return rgb(255, 128, 0);
    }
    static constexpr auto named_yellow() -> TagColor {
        return rgb(255, 255, 0);
    }
    static constexpr auto named_green() -> TagColor {
        return rgb(0, 255, 0);
    }
    static constexpr auto named_blue() -> TagColor {
        return rgb(0, 0, 255);
    }
    static constexpr auto named_purple() -> TagColor {
        return rgb(128, 0, 255);
    }

    /// "red", "orange", ... for the six named colors; nullopt otherwise.
    [[nodiscard]] auto name() const -> std::optional<std::string_view>;

    /// "#rrggbb".
    [[nodiscard]] auto description() const -> std::string;

    auto operator<=>(const TagColor&) const = default;
};

// ============================================================================
// Parameters and Test Cases
// ============================================================================

/// One declared parameter of a parameterized test.
struct Parameter {
    std::string first_name;
    std::optional<std::string> second_name;

    /// The second name if present, else the first.
    [[nodiscard]] auto label() const -> const std::string& {
        return second_name ? *second_name : first_name;
    }

    /// False when the label is the "_" placeholder.
    [[nodiscard]] auto has_label() const -> bool {
        return label() != "_";
    }
};

/// One invocation of a test with a concrete set of arguments.
struct TestCase {
    /// Argument values, already rendered for display, in parameter order.
    std::vector<std::string> arguments;

    /// True when this case is one of several invocations of the same test.
    bool is_parameterized = false;
};

// ============================================================================
// Tests
// ============================================================================

/// A test function or a suite.
struct Test {
    std::string name;
    std::optional<std::string> display_name;
    TestId id;
    bool is_suite = false;
    std::set<Tag> tags;
    std::vector<Comment> comments;

    /// Declared parameters; nullopt for suites and non-parameterized tests.
    std::optional<std::vector<Parameter>> parameters;

    [[nodiscard]] auto is_parameterized() const -> bool {
        return parameters && !parameters->empty();
    }
};

// ============================================================================
// Issues
// ============================================================================

namespace issue {

/// An issue recorded without a condition (an explicit "fail here").
struct Unconditional {};

/// An expectation evaluated to false.
struct ExpectationFailed {
    std::string expression;
    std::optional<std::string> difference;
};

/// A confirmation was confirmed the wrong number of times.
struct ConfirmationMiscounted {
    int actual = 0;
    int expected = 0;
};

/// A test threw an error.
struct ErrorCaught {
    std::string description;
};

/// A test ran past its time limit.
struct TimeLimitExceeded {
    std::chrono::milliseconds limit{0};
};

/// A known-issue block finished without recording the issue it expected.
struct KnownIssueNotRecorded {};

/// The testing API was used incorrectly.
struct ApiMisused {};

/// A failure in the test engine itself.
struct System {};

} // namespace issue

/// What went wrong.
using IssueKind =
    std::variant<issue::Unconditional, issue::ExpectationFailed, issue::ConfirmationMiscounted,
                 issue::ErrorCaught, issue::TimeLimitExceeded, issue::KnownIssueNotRecorded,
                 issue::ApiMisused, issue::System>;

/// Human-readable description of an issue kind.
[[nodiscard]] auto describe(const IssueKind& kind) -> std::string;

/// A failure, or an expected failure, recorded against a test.
struct Issue {
    IssueKind kind = issue::Unconditional{};
    bool is_known = false;
    std::vector<Comment> comments;
    std::optional<SourceLocation> source_location;

    /// The difference text of a failed expectation, if it has one.
    [[nodiscard]] auto difference() const -> const std::optional<std::string>&;
};

} // namespace testrec::events
