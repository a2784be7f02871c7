#include "testrec/events/test.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace testrec::events {

// ============================================================================
// SourceLocation
// ============================================================================

auto SourceLocation::description() const -> std::string {
    std::string_view path = file_path;
    size_t sep = path.find_last_of("/\\");
    std::string_view file_name = sep == std::string_view::npos ? path : path.substr(sep + 1);

    std::ostringstream oss;
    oss << file_name << ":" << line << ":" << column;
    return oss.str();
}

// ============================================================================
// TestId
// ============================================================================

auto TestId::child(std::string component) const -> TestId {
    std::vector<std::string> path = key_path_;
    path.push_back(std::move(component));
    return TestId(std::move(path));
}

auto TestId::parent() const -> std::optional<TestId> {
    if (key_path_.empty()) {
        return std::nullopt;
    }
    return TestId(std::vector<std::string>(key_path_.begin(), key_path_.end() - 1));
}

auto TestId::is_ancestor_of(const TestId& other) const -> bool {
    if (other.key_path_.size() <= key_path_.size()) {
        return false;
    }
    return std::equal(key_path_.begin(), key_path_.end(), other.key_path_.begin());
}

auto TestId::description() const -> std::string {
    std::string result;
    for (size_t i = 0; i < key_path_.size(); ++i) {
        if (i > 0)
            result += '/';
        result += key_path_[i];
    }
    return result;
}

// ============================================================================
// TagColor
// ============================================================================

auto TagColor::name() const -> std::optional<std::string_view> {
    if (*this == named_red())
        return "red";
    if (*this == named_orange())
        return "orange";
    if (*this == named_yellow())
        return "yellow";
    if (*this == named_green())
        return "green";
    if (*this == named_blue())
        return "blue";
    if (*this == named_purple())
        return "purple";
    return std::nullopt;
}

auto TagColor::description() const -> std::string {
    std::ostringstream oss;
    oss << '#' << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(red)
        << std::setw(2) << static_cast<int>(green) << std::setw(2) << static_cast<int>(blue);
    return oss.str();
}

// ============================================================================
// Issues
// ============================================================================

namespace {

auto counting_times(int count) -> std::string {
    return std::to_string(count) + (count == 1 ? " time" : " times");
}

} // namespace

auto describe(const IssueKind& kind) -> std::string {
    return std::visit(
        [](const auto& k) -> std::string {
            using K = std::decay_t<decltype(k)>;

            if constexpr (std::is_same_v<K, issue::Unconditional>) {
                return "Issue recorded";
            } else if constexpr (std::is_same_v<K, issue::ExpectationFailed>) {
                return "Expectation failed: " + k.expression;
            } else if constexpr (std::is_same_v<K, issue::ConfirmationMiscounted>) {
                return "Confirmation was confirmed " + counting_times(k.actual) +
                       ", but expected to be confirmed " + counting_times(k.expected);
            } else if constexpr (std::is_same_v<K, issue::ErrorCaught>) {
                return "Caught error: " + k.description;
            } else if constexpr (std::is_same_v<K, issue::TimeLimitExceeded>) {
                std::ostringstream oss;
                oss << "Time limit was exceeded: " << std::fixed << std::setprecision(3)
                    << static_cast<double>(k.limit.count()) / 1000.0 << " seconds";
                return oss.str();
            } else if constexpr (std::is_same_v<K, issue::KnownIssueNotRecorded>) {
                return "Known issue was not recorded";
            } else if constexpr (std::is_same_v<K, issue::ApiMisused>) {
                return "An API was misused";
            } else if constexpr (std::is_same_v<K, issue::System>) {
                return "A system failure occurred";
            } else {
                static_assert(sizeof(K) == 0, "unhandled issue kind");
            }
        },
        kind);
}

auto Issue::difference() const -> const std::optional<std::string>& {
    static const std::optional<std::string> none;
    if (const auto* failed = std::get_if<issue::ExpectationFailed>(&kind)) {
        return failed->difference;
    }
    return none;
}

} // namespace testrec::events
