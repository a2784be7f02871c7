#include "testrec/events/event.hpp"

#include <type_traits>

namespace testrec::events {

auto event_kind_name(const EventKind& kind) -> const char* {
    return std::visit(
        [](const auto& k) -> const char* {
            using K = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<K, kind::RunStarted>)
                return "runStarted";
            else if constexpr (std::is_same_v<K, kind::RunEnded>)
                return "runEnded";
            else if constexpr (std::is_same_v<K, kind::PlanStepStarted>)
                return "planStepStarted";
            else if constexpr (std::is_same_v<K, kind::PlanStepEnded>)
                return "planStepEnded";
            else if constexpr (std::is_same_v<K, kind::TestStarted>)
                return "testStarted";
            else if constexpr (std::is_same_v<K, kind::TestEnded>)
                return "testEnded";
            else if constexpr (std::is_same_v<K, kind::TestSkipped>)
                return "testSkipped";
            else if constexpr (std::is_same_v<K, kind::TestBypassed>)
                return "testBypassed";
            else if constexpr (std::is_same_v<K, kind::ExpectationChecked>)
                return "expectationChecked";
            else if constexpr (std::is_same_v<K, kind::IssueRecorded>)
                return "issueRecorded";
            else if constexpr (std::is_same_v<K, kind::TestCaseStarted>)
                return "testCaseStarted";
            else if constexpr (std::is_same_v<K, kind::TestCaseEnded>)
                return "testCaseEnded";
            else
                static_assert(sizeof(K) == 0, "unhandled event kind");
        },
        kind);
}

} // namespace testrec::events
