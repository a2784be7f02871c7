//! # Recorder Options Parsing
//!
//! Reads recorder flags from argv, falls back to the environment, and
//! resolves `auto` color mode against the terminal attached to stdout.

#include "testrec/recorder/options.hpp"

#include "testrec/log/log.hpp"
#include "testrec/terminal.hpp"

#include <cctype>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>

namespace testrec::recorder {

namespace {

auto hex_digit(char c) -> int {
    if (c >= '0' && c <= '9')
        return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

} // namespace

auto parse_color_mode(std::string_view text) -> Result<ColorMode> {
    if (text == "auto")
        return ColorMode::Auto;
    if (text == "always")
        return ColorMode::Always;
    if (text == "never")
        return ColorMode::Never;
    return "unknown color mode '" + std::string(text) + "' (expected auto, always or never)";
}

auto parse_tag_color(std::string_view text) -> Result<events::TagColor> {
    using events::TagColor;

    if (text == "red")
        return TagColor::named_red();
    if (text == "orange")
        return TagColor::named_orange();
    if (text == "yellow")
        return TagColor::named_yellow();
    if (text == "green")
        return TagColor::named_green();
    if (text == "blue")
        return TagColor::named_blue();
    if (text == "purple")
        return TagColor::named_purple();

    if (text.size() != 7 || text[0] != '#') {
        return "invalid color '" + std::string(text) + "' (expected a color name or #rrggbb)";
    }

    uint8_t channels[3];
    for (size_t i = 0; i < 3; ++i) {
        int hi = hex_digit(text[1 + i * 2]);
        int lo = hex_digit(text[2 + i * 2]);
        if (hi < 0 || lo < 0) {
            return "invalid hex digits in color '" + std::string(text) + "'";
        }
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return TagColor::rgb(channels[0], channels[1], channels[2]);
}

auto parse_tag_color_binding(std::string_view text)
    -> Result<std::pair<events::Tag, events::TagColor>> {
    size_t eq = text.rfind('=');
    if (eq == std::string_view::npos || eq == 0) {
        return "invalid tag color binding '" + std::string(text) + "' (expected <tag>=<color>)";
    }

    auto color = parse_tag_color(text.substr(eq + 1));
    if (is_err(color)) {
        return unwrap_err(color);
    }

    events::Tag tag{std::string(text.substr(0, eq)), std::nullopt};
    return std::make_pair(std::move(tag), unwrap(color));
}

auto parse_recorder_options(int argc, char* argv[]) -> RecorderOptions {
    RecorderOptions options;

    std::optional<ColorMode> color_mode;
    bool force_256_colors = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.starts_with("--color=")) {
            auto mode = parse_color_mode(arg.substr(8));
            if (is_ok(mode)) {
                color_mode = unwrap(mode);
            } else {
                TESTREC_LOG_WARN("options", unwrap_err(mode));
            }
        } else if (arg == "--no-color") {
            color_mode = ColorMode::Never;
        } else if (arg == "--256-color") {
            force_256_colors = true;
        } else if (arg == "--sf-symbols") {
            options.use_sf_symbols = true;
        } else if (arg.starts_with("--tag-color=")) {
            auto binding = parse_tag_color_binding(arg.substr(12));
            if (is_ok(binding)) {
                const auto& [tag, color] = unwrap(binding);
                options.tag_colors.push_back(TagColorMap{{tag, color}});
            } else {
                TESTREC_LOG_WARN("options", "Ignoring --tag-color: " << unwrap_err(binding));
            }
        }
    }

    if (!color_mode) {
        std::string env_mode = get_env("TESTREC_COLOR");
        if (!env_mode.empty()) {
            auto mode = parse_color_mode(env_mode);
            if (is_ok(mode)) {
                color_mode = unwrap(mode);
            } else {
                TESTREC_LOG_WARN("options", "TESTREC_COLOR: " << unwrap_err(mode));
            }
        }
    }

    switch (color_mode.value_or(ColorMode::Auto)) {
    case ColorMode::Always:
        options.use_ansi_escape_codes = true;
        options.use_256_color_ansi_escape_codes = force_256_colors || terminal_supports_256_colors();
        break;
    case ColorMode::Never:
        options.use_ansi_escape_codes = false;
        break;
    case ColorMode::Auto:
        options.use_ansi_escape_codes =
            get_env("NO_COLOR").empty() && terminal_supports_colors(stdout);
        options.use_256_color_ansi_escape_codes =
            options.use_ansi_escape_codes && (force_256_colors || terminal_supports_256_colors());
        break;
    }

    TESTREC_LOG_DEBUG("options", "ansi=" << options.use_ansi_escape_codes
                                          << " 256color=" << options.use_256_color_ansi_escape_codes
                                          << " sf_symbols=" << options.use_sf_symbols
                                          << " tag_color_sources=" << options.tag_colors.size());
    return options;
}

} // namespace testrec::recorder
