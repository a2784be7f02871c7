#include "testrec/recorder/tag_colors.hpp"

#include "testrec/recorder/ansi.hpp"

namespace testrec::recorder {

using events::Tag;
using events::TagColor;

auto builtin_tag_colors() -> const TagColorMap& {
    static const TagColorMap builtins = {
        {Tag{"red", std::nullopt}, TagColor::named_red()},
        {Tag{"orange", std::nullopt}, TagColor::named_orange()},
        {Tag{"yellow", std::nullopt}, TagColor::named_yellow()},
        {Tag{"green", std::nullopt}, TagColor::named_green()},
        {Tag{"blue", std::nullopt}, TagColor::named_blue()},
        {Tag{"purple", std::nullopt}, TagColor::named_purple()},
    };
    return builtins;
}

auto merge_tag_colors(const RecorderOptions& options) -> TagColorMap {
    TagColorMap merged = builtin_tag_colors();
    for (const auto& source : options.tag_colors) {
        // map::insert keeps the existing binding on collision
        merged.insert(source.begin(), source.end());
    }
    return merged;
}

auto resolve_tag_color(const TagColorMap& colors, const Tag& tag) -> std::optional<TagColor> {
    if (auto it = colors.find(tag); it != colors.end()) {
        return it->second;
    }
    if (tag.source_code) {
        if (auto it = colors.find(Tag{*tag.source_code, std::nullopt}); it != colors.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

auto ansi_escape_code(const TagColor& color, bool use_256_colors) -> std::optional<std::string> {
    if (use_256_colors) {
        return std::string(colors::escape_prefix) + "38;5;" +
               std::to_string(ansi_256_color_index(color)) + "m";
    }

    if (color == TagColor::named_red())
        return colors::bright_red;
    if (color == TagColor::named_orange())
        return colors::yellow;
    if (color == TagColor::named_yellow())
        return colors::bright_yellow;
    if (color == TagColor::named_green())
        return colors::bright_green;
    if (color == TagColor::named_blue())
        return colors::bright_blue;
    if (color == TagColor::named_purple())
        return colors::bright_magenta;

    // TODO: approximate arbitrary colors in 16-color mode via HSV distance to
    // the named colors.
    return std::nullopt;
}

auto color_dots(const std::set<Tag>& tags, const TagColorMap& colors,
                const RecorderOptions& options) -> std::string {
    if (!options.use_ansi_escape_codes) {
        return "";
    }

    std::set<TagColor> resolved;
    for (const auto& tag : tags) {
        if (auto color = resolve_tag_color(colors, tag)) {
            resolved.insert(*color);
        }
    }

    std::string dots;
    for (const auto& color : resolved) {
        if (auto escape = ansi_escape_code(color, options.use_256_color_ansi_escape_codes)) {
            dots += *escape;
            dots += "\u25CF"; // BLACK CIRCLE
        }
    }
    return dots;
}

} // namespace testrec::recorder
