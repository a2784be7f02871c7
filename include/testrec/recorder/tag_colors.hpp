//! # Tag Colors
//!
//! Resolves a test's tags to colors and draws them as colored dots in front
//! of the test's name.
//!
//! ## Precedence
//!
//! The six built-in tags (`red`, `orange`, `yellow`, `green`, `blue`,
//! `purple`) always map to their own color. User bindings are merged on top
//! in the order they were specified; when two user sources bind the same
//! tag, the first one wins. Built-ins cannot be overridden.

#pragma once

#include "testrec/recorder/options.hpp"

#include <optional>
#include <set>
#include <string>

namespace testrec::recorder {

/// The built-in tag to color bindings.
[[nodiscard]] auto builtin_tag_colors() -> const TagColorMap&;

/// Built-in bindings merged with every map in `options.tag_colors`.
[[nodiscard]] auto merge_tag_colors(const RecorderOptions& options) -> TagColorMap;

/// Looks `tag` up by value, then by its source-code spelling.
[[nodiscard]] auto resolve_tag_color(const TagColorMap& colors, const events::Tag& tag)
    -> std::optional<events::TagColor>;

/// Foreground escape code for `color`.
///
/// With 256 colors, any color maps onto the 6x6x6 color cube. With 16 colors,
/// only the six named colors have a code; others yield nullopt.
[[nodiscard]] auto ansi_escape_code(const events::TagColor& color, bool use_256_colors)
    -> std::optional<std::string>;

/// Index into the 256-color palette: 16 + 36r + 6g + b, each channel scaled
/// from 0-255 down to 0-5.
[[nodiscard]] constexpr auto ansi_256_color_index(const events::TagColor& color) -> int {
    int r = (color.red * 5) / 255;
    int g = (color.green * 5) / 255;
    int b = (color.blue * 5) / 255;
    return 16 + 36 * r + 6 * g + b;
}

/// One "<escape>●" per distinct resolved color, sorted, with no resets in
/// between. Empty when ANSI is off or nothing resolves. The caller appends
/// the single reset.
[[nodiscard]] auto color_dots(const std::set<events::Tag>& tags, const TagColorMap& colors,
                              const RecorderOptions& options) -> std::string;

} // namespace testrec::recorder
