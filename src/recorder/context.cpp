#include "testrec/recorder/context.hpp"

#include <algorithm>

namespace testrec::recorder {

namespace {

/// True if `path` is `prefix` or nested inside it.
auto has_prefix(const std::vector<std::string>& path, const std::vector<std::string>& prefix)
    -> bool {
    return path.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), path.begin());
}

} // namespace

void RecorderContext::record_run_start(events::Instant instant) {
    std::lock_guard<std::mutex> lock(mutex_);
    run_start_instant_ = instant;
}

bool RecorderContext::observe(const events::TestId& id, events::Instant instant, bool is_suite) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, _] = test_data_.try_emplace(id.key_path(), TestData{instant, 0, 0});
    if (it->second.counted) {
        return false;
    }
    it->second.counted = true;
    if (is_suite) {
        suite_count_++;
    } else {
        test_count_++;
    }
    return true;
}

bool RecorderContext::increment_issue(const events::TestId& id, bool known,
                                      events::Instant instant) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = test_data_.try_emplace(id.key_path(), TestData{instant, 0, 0});
    if (known) {
        it->second.known_issue_count++;
    } else {
        it->second.issue_count++;
    }
    return !inserted;
}

auto RecorderContext::read_subtree(const events::TestId& id) const -> SubtreeSnapshot {
    const auto& path = id.key_path();

    SubtreeSnapshot snapshot;
    std::lock_guard<std::mutex> lock(mutex_);

    // Everything at or below `path` sorts from lower_bound(path) onward
    for (auto it = test_data_.lower_bound(path);
         it != test_data_.end() && has_prefix(it->first, path); ++it) {
        if (it->first.size() == path.size()) {
            snapshot.root = it->second;
        }
        snapshot.issue_count += it->second.issue_count;
        snapshot.known_issue_count += it->second.known_issue_count;
    }

    return snapshot;
}

auto RecorderContext::read_all() const -> RunSnapshot {
    RunSnapshot snapshot;
    std::lock_guard<std::mutex> lock(mutex_);

    snapshot.run_start_instant = run_start_instant_;
    snapshot.test_count = test_count_;
    snapshot.suite_count = suite_count_;
    for (const auto& [_, data] : test_data_) {
        snapshot.issue_count += data.issue_count;
        snapshot.known_issue_count += data.known_issue_count;
    }
    return snapshot;
}

auto RecorderContext::entry_count() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return test_data_.size();
}

} // namespace testrec::recorder
