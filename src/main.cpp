//! # testrec Demo Driver
//!
//! Feeds a small simulated test run through a `Recorder` and prints the
//! result to stdout. Tests in the simulated suite run on separate threads,
//! so the output shows the recorder's aggregation under concurrency.
//!
//! ## Usage
//!
//! ```bash
//! testrec-demo                          # colors when stdout is a terminal
//! testrec-demo --color=always --256-color
//! testrec-demo --tag-color=.network=#00aaff -vv
//! ```
//!
//! Recorder flags are described in `recorder/options.hpp`, logging flags in
//! `log/log.hpp`.

#include "testrec/events/event.hpp"
#include "testrec/log/log.hpp"
#include "testrec/recorder/options.hpp"
#include "testrec/recorder/recorder.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace testrec;
using namespace testrec::events;

namespace {

auto make_test(TestId id, std::string name) -> Test {
    Test test;
    test.name = std::move(name);
    test.id = std::move(id);
    return test;
}

void emit(recorder::Recorder& recorder, EventKind kind, const Test* test = nullptr,
          const TestCase* test_case = nullptr) {
    recorder.record(Event{std::move(kind), Clock::now()}, EventContext{test, test_case});
}

/// Runs one plain test: start, a few expectations, an optional issue, end.
void run_test(recorder::Recorder& recorder, const Test& test, std::optional<Issue> issue,
              std::chrono::milliseconds work) {
    emit(recorder, kind::TestStarted{}, &test);
    std::this_thread::sleep_for(work);
    emit(recorder, kind::ExpectationChecked{true}, &test);
    if (issue) {
        emit(recorder, kind::ExpectationChecked{false}, &test);
        emit(recorder, kind::IssueRecorded{*issue}, &test);
    }
    emit(recorder, kind::TestEnded{}, &test);
}

} // namespace

int main(int argc, char* argv[]) {
    testrec::log::Logger::init(testrec::log::parse_log_options(argc, argv));
    recorder::RecorderOptions options = recorder::parse_recorder_options(argc, argv);

    std::mutex stdout_mutex;
    recorder::Recorder recorder(options, [&stdout_mutex](const std::string& text) {
        std::lock_guard<std::mutex> lock(stdout_mutex);
        std::cout << text << std::flush;
    });

    TestId suite_id({"Demo", "ParserTests"});
    Test suite = make_test(suite_id, "ParserTests");
    suite.is_suite = true;

    Test parses_numbers = make_test(suite_id.child("parses_numbers()"), "parses_numbers()");
    parses_numbers.tags = {Tag{"green", std::nullopt}};

    Test rejects_garbage = make_test(suite_id.child("rejects_garbage()"), "rejects_garbage()");
    rejects_garbage.display_name = "Rejects garbage input";
    rejects_garbage.tags = {Tag{"red", std::nullopt}, Tag{"network", ".network"}};
    rejects_garbage.comments = {Comment{"Input comes from the fuzz corpus."}};

    Test flaky_timeout = make_test(suite_id.child("flaky_timeout()"), "flaky_timeout()");

    Test handles_unicode = make_test(suite_id.child("handles_unicode()"), "handles_unicode()");

    Test round_trips = make_test(suite_id.child("round_trips(input:radix:)"), "round_trips");
    round_trips.parameters = std::vector<Parameter>{{"input", std::nullopt}, {"radix", "_"}};

    Issue failure;
    failure.kind = issue::ExpectationFailed{"parse(\"1x\") == nullopt", "- nullopt\n+ 1"};
    failure.source_location = SourceLocation{"tests/parser_test.cpp", 42, 9};
    failure.comments = {Comment{"Trailing characters must be rejected."}};

    Issue known;
    known.kind = issue::ErrorCaught{"invalid code point"};
    known.is_known = true;

    emit(recorder, kind::RunStarted{});
    emit(recorder, kind::PlanStepStarted{}, &suite);
    emit(recorder, kind::TestStarted{}, &suite);

    {
        std::vector<std::thread> workers;
        workers.emplace_back(run_test, std::ref(recorder), std::cref(parses_numbers),
                             std::nullopt, std::chrono::milliseconds(15));
        workers.emplace_back(run_test, std::ref(recorder), std::cref(rejects_garbage),
                             std::optional<Issue>(failure), std::chrono::milliseconds(25));
        workers.emplace_back(run_test, std::ref(recorder), std::cref(handles_unicode),
                             std::optional<Issue>(known), std::chrono::milliseconds(5));
        workers.emplace_back([&recorder, &flaky_timeout] {
            emit(recorder, kind::TestSkipped{Comment{"flaky on CI"}}, &flaky_timeout);
        });
        for (auto& worker : workers) {
            worker.join();
        }
    }

    emit(recorder, kind::TestStarted{}, &round_trips);
    for (const char* input : {"\"10\"", "\"ff\""}) {
        TestCase test_case{{input, "16"}, true};
        emit(recorder, kind::TestCaseStarted{}, &round_trips, &test_case);
        emit(recorder, kind::ExpectationChecked{true}, &round_trips, &test_case);
        emit(recorder, kind::TestCaseEnded{}, &round_trips, &test_case);
    }
    emit(recorder, kind::TestEnded{}, &round_trips);

    emit(recorder, kind::TestEnded{}, &suite);
    emit(recorder, kind::PlanStepEnded{}, &suite);
    emit(recorder, kind::RunEnded{});

    testrec::log::Logger::instance().flush();
    return recorder.context().read_all().issue_count > 0 ? 1 : 0;
}
