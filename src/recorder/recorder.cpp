#include "testrec/recorder/recorder.hpp"

#include "testrec/log/log.hpp"
#include "testrec/recorder/ansi.hpp"
#include "testrec/recorder/environment.hpp"
#include "testrec/recorder/format.hpp"
#include "testrec/recorder/symbol.hpp"
#include "testrec/recorder/tag_colors.hpp"

#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace testrec::recorder {

namespace {

constexpr const char* unknown_test_name = "\u00ABunknown\u00BB";

} // namespace

Recorder::Recorder(RecorderOptions options, WriteFunction write)
    : options_(std::move(options)), tag_colors_(merge_tag_colors(options_)),
      write_(std::move(write)) {}

// ============================================================================
// Dispatch
// ============================================================================

auto Recorder::render(const events::Event& event, const events::EventContext& context)
    -> std::optional<std::string> {
    const events::Test* test = context.test;
    std::string name = test_name(test);
    events::Instant instant = event.instant;

    return std::visit(
        [&](const auto& k) -> std::optional<std::string> {
            using K = std::decay_t<decltype(k)>;
            using namespace events::kind;

            if constexpr (std::is_same_v<K, RunStarted>) {
                return render_run_started(instant);
            } else if constexpr (std::is_same_v<K, PlanStepStarted> ||
                                 std::is_same_v<K, PlanStepEnded>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<K, TestStarted>) {
                return render_test_started(test, name, instant);
            } else if constexpr (std::is_same_v<K, TestEnded>) {
                return render_test_ended(test, name, instant);
            } else if constexpr (std::is_same_v<K, TestSkipped>) {
                return render_test_skipped(test, name, k, instant);
            } else if constexpr (std::is_same_v<K, TestBypassed>) {
                // Superseded by TestSkipped; engines emitting both would print twice.
                return std::nullopt;
            } else if constexpr (std::is_same_v<K, ExpectationChecked>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<K, IssueRecorded>) {
                return render_issue(context, name, k.issue, instant);
            } else if constexpr (std::is_same_v<K, TestCaseStarted>) {
                return render_test_case_started(context, name);
            } else if constexpr (std::is_same_v<K, TestCaseEnded>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<K, RunEnded>) {
                return render_run_ended(instant);
            } else {
                static_assert(sizeof(K) == 0, "unhandled event kind");
            }
        },
        event.kind);
}

bool Recorder::record(const events::Event& event, const events::EventContext& context) {
    auto output = render(event, context);
    if (!output) {
        return false;
    }
    if (write_) {
        write_(*output);
    }
    return true;
}

auto Recorder::test_name(const events::Test* test) const -> std::string {
    if (!test) {
        return unknown_test_name;
    }

    std::string name = test->display_name ? "\"" + *test->display_name + "\"" : test->name;
    if (options_.use_ansi_escape_codes && !test->tags.empty()) {
        std::string dots = color_dots(test->tags, tag_colors_, options_);
        if (!dots.empty()) {
            name = dots + colors::reset + " " + name;
        }
    }
    return name;
}

// ============================================================================
// Run Lifecycle
// ============================================================================

auto Recorder::render_run_started(events::Instant instant) -> std::string {
    context_.record_run_start(instant);

    std::vector<events::Comment> comments = {
        {"Testing Library Version: " + library_version()},
        {"Compiler Version: " + compiler_version()},
        {"OS Version: " + operating_system_version()},
    };

    std::string line = symbol_string(Symbol::default_symbol(), options_) + " Test run started.\n";
    if (auto block = format_comments(comments, options_)) {
        line += *block;
        line += '\n';
    }
    return line;
}

auto Recorder::render_run_ended(events::Instant instant) -> std::string {
    RunSnapshot run = context_.read_all();
    events::Instant start = run.run_start_instant.value_or(instant);
    if (!run.run_start_instant) {
        TESTREC_LOG_DEBUG("recorder", "run ended without a run start");
    }

    std::string duration = format_duration(start, instant);
    std::string suffix = issue_suffix(run.issue_count, run.known_issue_count);
    std::string tests = counting(run.test_count, "test");

    if (run.issue_count > 0) {
        return symbol_string(Symbol::fail(), options_) + " Test run with " + tests +
               " failed after " + duration + suffix + ".\n";
    }
    return symbol_string(Symbol::pass(run.known_issue_count > 0), options_) + " Test run with " +
           tests + " passed after " + duration + suffix + ".\n";
}

// ============================================================================
// Test Lifecycle
// ============================================================================

auto Recorder::render_test_started(const events::Test* test, const std::string& name,
                                   events::Instant instant) -> std::string {
    if (test) {
        if (!context_.observe(test->id, instant, test->is_suite)) {
            TESTREC_LOG_DEBUG("recorder", "test " << test->id.description()
                                                  << " was already started or skipped");
        }
    } else {
        TESTREC_LOG_DEBUG("recorder", "testStarted without a test");
    }
    return symbol_string(Symbol::default_symbol(), options_) + " Test " + name + " started.\n";
}

auto Recorder::render_test_ended(const events::Test* test, const std::string& name,
                                 events::Instant instant) -> std::string {
    SubtreeSnapshot subtree;
    if (test) {
        subtree = context_.read_subtree(test->id);
        if (!subtree.root) {
            TESTREC_LOG_DEBUG("recorder", "test " << test->id.description()
                                                  << " ended without being started");
        }
    } else {
        TESTREC_LOG_DEBUG("recorder", "testEnded without a test");
    }

    events::Instant start = subtree.root ? subtree.root->start_instant : instant;
    std::string duration = format_duration(start, instant);
    std::string suffix = issue_suffix(subtree.issue_count, subtree.known_issue_count);

    if (subtree.issue_count > 0) {
        std::string line = symbol_string(Symbol::fail(), options_) + " Test " + name +
                           " failed after " + duration + suffix + ".\n";
        if (test) {
            if (auto block = format_comments(test->comments, options_)) {
                line += *block;
                line += '\n';
            }
        }
        return line;
    }
    return symbol_string(Symbol::pass(subtree.known_issue_count > 0), options_) + " Test " + name +
           " passed after " + duration + suffix + ".\n";
}

auto Recorder::render_test_skipped(const events::Test* test, const std::string& name,
                                   const events::kind::TestSkipped& skip, events::Instant instant)
    -> std::string {
    if (test) {
        context_.observe(test->id, instant, test->is_suite);
    } else {
        TESTREC_LOG_DEBUG("recorder", "testSkipped without a test");
    }

    std::string symbol = symbol_string(Symbol::skip(), options_);
    if (skip.comment) {
        return symbol + " Test " + name + " skipped: \"" + skip.comment->text + "\"\n";
    }
    return symbol + " Test " + name + " skipped.\n";
}

// ============================================================================
// Issues and Test Cases
// ============================================================================

auto Recorder::render_issue(const events::EventContext& context, const std::string& name,
                            const events::Issue& issue, events::Instant instant) -> std::string {
    const events::Test* test = context.test;
    if (test) {
        if (!context_.increment_issue(test->id, issue.is_known, instant)) {
            TESTREC_LOG_DEBUG("recorder", "issue recorded for untracked test "
                                              << test->id.description());
        }
    }

    std::string line = issue.is_known ? symbol_string(Symbol::pass(true), options_)
                                      : symbol_string(Symbol::fail(), options_);
    line += " Test " + name + " recorded a";
    line += issue.is_known ? " known" : "n";
    line += " issue";

    if (test && test->is_parameterized()) {
        const auto& parameters = *test->parameters;
        line += " with " + counting(static_cast<int>(parameters.size()), "argument");
        line += ' ';
        if (context.test_case) {
            line += labeled_arguments(*context.test_case, parameters);
        }
    }

    if (issue.source_location) {
        line += " at " + issue.source_location->description();
    }
    line += ": " + events::describe(issue.kind);

    if (const auto& difference = issue.difference()) {
        line += '\n';
        line += symbol_string(Symbol::difference(), options_);
        line += ' ';
        line += *difference;
    }
    if (auto block = format_comments(issue.comments, options_)) {
        line += '\n';
        line += *block;
    }
    line += '\n';
    return line;
}

auto Recorder::render_test_case_started(const events::EventContext& context,
                                        const std::string& name) -> std::optional<std::string> {
    const events::Test* test = context.test;
    const events::TestCase* test_case = context.test_case;
    if (!test || !test_case || !test_case->is_parameterized || !test->parameters) {
        return std::nullopt;
    }

    const auto& parameters = *test->parameters;
    return symbol_string(Symbol::default_symbol(), options_) + " Passing " +
           counting(static_cast<int>(parameters.size()), "argument") + " " +
           labeled_arguments(*test_case, parameters) + " to " + name + "\n";
}

// ============================================================================
// Warnings
// ============================================================================

auto warning(const std::string& message, const RecorderOptions& options) -> std::string {
    return symbol_string(Symbol::warning(), options) + " " + message;
}

} // namespace testrec::recorder
