#include "testrec/recorder/format.hpp"

#include "testrec/recorder/ansi.hpp"
#include "testrec/recorder/symbol.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace testrec::recorder {

// ============================================================================
// Durations and Counts
// ============================================================================

auto format_duration(events::Instant start, events::Instant end) -> std::string {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    int64_t ms = std::max<int64_t>(elapsed.count(), 0);

    std::ostringstream oss;
    oss << ms / 1000 << '.' << std::setfill('0') << std::setw(3) << ms % 1000 << " seconds";
    return oss.str();
}

auto counting(int count, std::string_view noun) -> std::string {
    std::string result = std::to_string(count);
    result += ' ';
    result += noun;
    if (count != 1) {
        result += 's';
    }
    return result;
}

auto issue_suffix(int issue_count, int known_issue_count) -> std::string {
    int total = issue_count + known_issue_count;
    if (issue_count > 0 && known_issue_count > 0) {
        return " with " + counting(total, "issue") + " (including " +
               counting(known_issue_count, "known issue") + ")";
    }
    if (known_issue_count > 0) {
        return " with " + counting(known_issue_count, "known issue");
    }
    if (issue_count > 0) {
        return " with " + counting(issue_count, "issue");
    }
    return "";
}

// ============================================================================
// Comments and Arguments
// ============================================================================

namespace {

/// Splits on '\n' and "\r\n", dropping empty lines.
auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find_first_of("\r\n", pos);
        if (nl == std::string_view::npos) {
            nl = text.size();
        }
        if (nl > pos) {
            lines.push_back(text.substr(pos, nl - pos));
        }
        pos = nl + 1;
    }
    return lines;
}

} // namespace

auto format_comments(const std::vector<events::Comment>& comments, const RecorderOptions& options)
    -> std::optional<std::string> {
    if (comments.empty()) {
        return std::nullopt;
    }

    const GlyphTable& table = glyph_table(select_glyph_table(options));
    std::string arrow(table.comment_arrow);
    if (table.pad_under_ansi && options.use_ansi_escape_codes) {
        arrow += ' ';
    }

    std::string block;
    bool first_line = true;
    for (const auto& comment : comments) {
        auto lines = split_lines(comment.text);
        for (size_t i = 0; i < lines.size(); ++i) {
            if (!first_line) {
                block += '\n';
            }
            first_line = false;
            if (i == 0) {
                block += arrow;
                block += ' ';
            } else {
                block += "  ";
            }
            block += lines[i];
        }
    }

    if (options.use_ansi_escape_codes) {
        return colors::gray + block + colors::reset;
    }
    return block;
}

auto labeled_arguments(const events::TestCase& test_case,
                       const std::vector<events::Parameter>& parameters) -> std::string {
    std::string result;
    size_t count = std::min(test_case.arguments.size(), parameters.size());
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) {
            result += ", ";
        }
        if (parameters[i].has_label()) {
            result += parameters[i].label();
            result += " \u2192 "; // RIGHTWARDS ARROW
        }
        result += test_case.arguments[i];
    }
    return result;
}

} // namespace testrec::recorder
