//! # Recorder Options
//!
//! Presentation settings for a `Recorder`, and the helpers that build them
//! from command-line arguments and the environment.
//!
//! ## Flags
//!
//! | Flag                          | Effect                                   |
//! |-------------------------------|------------------------------------------|
//! | `--color=auto\|always\|never` | ANSI escape codes (default `auto`)       |
//! | `--no-color`                  | Same as `--color=never`                  |
//! | `--256-color`                 | Use 256-color codes for tag colors       |
//! | `--sf-symbols`                | Use SF Symbols glyphs where available    |
//! | `--tag-color=<tag>=<color>`   | Bind a tag to a color (repeatable)       |
//!
//! `NO_COLOR` disables color in `auto` mode. `TESTREC_COLOR` supplies the
//! color mode when no color flag is given.

#pragma once

#include "testrec/common.hpp"
#include "testrec/events/test.hpp"

#include <map>
#include <string_view>
#include <vector>

namespace testrec::recorder {

/// Tag to color bindings.
using TagColorMap = std::map<events::Tag, events::TagColor>;

/// Options controlling how a Recorder formats its output.
struct RecorderOptions {
    /// Wrap symbols, comments and tag dots in ANSI escape codes.
    bool use_ansi_escape_codes = false;

    /// Use 256-color codes for tag colors. Ignored without ANSI.
    bool use_256_color_ansi_escape_codes = false;

    /// Use SF Symbols glyphs. Only honored on platforms that ship them.
    bool use_sf_symbols = false;

    /// User tag color bindings, one map per configuration source, in the
    /// order they were specified. See `merge_tag_colors()` for precedence.
    std::vector<TagColorMap> tag_colors;
};

/// When to emit ANSI escape codes.
enum class ColorMode { Auto, Always, Never };

/// Parses "auto", "always" or "never".
[[nodiscard]] auto parse_color_mode(std::string_view text) -> Result<ColorMode>;

/// Parses a named color ("red", "orange", "yellow", "green", "blue",
/// "purple") or "#rrggbb".
[[nodiscard]] auto parse_tag_color(std::string_view text) -> Result<events::TagColor>;

/// Parses "<tag>=<color>". The tag is taken verbatim, so a key such as
/// ".critical" matches tags whose source code is spelled that way.
[[nodiscard]] auto parse_tag_color_binding(std::string_view text)
    -> Result<std::pair<events::Tag, events::TagColor>>;

/// Builds options from argv and the environment, detecting terminal
/// capabilities of stdout in `auto` mode. Unrecognized arguments are left
/// for the caller; malformed recorder flags are logged and ignored.
[[nodiscard]] auto parse_recorder_options(int argc, char* argv[]) -> RecorderOptions;

} // namespace testrec::recorder
