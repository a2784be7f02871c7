#include "testrec/recorder/symbol.hpp"

#include "testrec/recorder/ansi.hpp"

namespace testrec::recorder {

// ============================================================================
// Glyph Tables
// ============================================================================

namespace {

constexpr GlyphTable unicode_table{
    "\u25C7",       // WHITE DIAMOND
    "\u2718",       // HEAVY BALLOT X
    "\u2714",       // HEAVY CHECK MARK
    "\u2718",       // HEAVY BALLOT X
    "\u2718",       // HEAVY BALLOT X
    "\u00B1",       // PLUS-MINUS SIGN
    "\u26A0\uFE0E", // WARNING SIGN + VARIATION SELECTOR-15 (text, not emoji)
    "\u21B3",       // DOWNWARDS ARROW WITH TIP RIGHTWARDS
    false,
};

// Consolas, the default Windows console font, lacks most of the glyphs above.
constexpr GlyphTable windows_console_table{
    "\u25CA", // LOZENGE
    "\u00D7", // MULTIPLICATION SIGN
    "\u221A", // SQUARE ROOT
    "\u00D7", // MULTIPLICATION SIGN
    "\u00D7", // MULTIPLICATION SIGN
    "\u00B1", // PLUS-MINUS SIGN
    "!",
    "\u21B3", // DOWNWARDS ARROW WITH TIP RIGHTWARDS
    false,
};

// Private Use Area code points of the SF Symbols font.
constexpr GlyphTable sf_symbols_table{
    "\U001007C8", // diamond
    "\U0010065F", // arrow.triangle.turn.up.right.diamond.fill
    "\U0010105B", // checkmark.diamond.fill
    "\U00100884", // xmark.diamond.fill
    "\U00100884", // xmark.diamond.fill
    "\U0010017A", // plus.forwardslash.minus
    "\U001001FF", // exclamationmark.triangle.fill
    "\U00100135", // arrow.turn.down.right
    true,
};

} // namespace

auto glyph_table(GlyphTableKind kind) -> const GlyphTable& {
    switch (kind) {
    case GlyphTableKind::Unicode:
        return unicode_table;
    case GlyphTableKind::WindowsConsole:
        return windows_console_table;
    case GlyphTableKind::SFSymbols:
        return sf_symbols_table;
    }
    return unicode_table;
}

auto platform_supports_sf_symbols() -> bool {
#if defined(__APPLE__)
    return true;
#else
    return false;
#endif
}

auto select_glyph_table(const RecorderOptions& options) -> GlyphTableKind {
    if (options.use_sf_symbols && platform_supports_sf_symbols()) {
        return GlyphTableKind::SFSymbols;
    }
#ifdef _WIN32
    return GlyphTableKind::WindowsConsole;
#else
    return GlyphTableKind::Unicode;
#endif
}

// ============================================================================
// Symbol Rendering
// ============================================================================

auto glyph(const GlyphTable& table, const Symbol& symbol) -> std::string_view {
    switch (symbol.kind) {
    case SymbolKind::Default:
        return table.default_symbol;
    case SymbolKind::Skip:
        return table.skip;
    case SymbolKind::Pass:
        return symbol.has_known_issues ? table.pass_with_known_issues : table.pass;
    case SymbolKind::Fail:
        return table.fail;
    case SymbolKind::Difference:
        return table.difference;
    case SymbolKind::Warning:
        return table.warning;
    }
    return table.default_symbol;
}

auto symbol_color(const Symbol& symbol) -> const char* {
    switch (symbol.kind) {
    case SymbolKind::Default:
    case SymbolKind::Skip:
    case SymbolKind::Difference:
        return colors::gray;
    case SymbolKind::Pass:
        return symbol.has_known_issues ? colors::gray : colors::bright_green;
    case SymbolKind::Fail:
        return colors::bright_red;
    case SymbolKind::Warning:
        return colors::bright_yellow;
    }
    return colors::gray;
}

auto symbol_string(const Symbol& symbol, const GlyphTable& table, bool use_ansi) -> std::string {
    std::string text(glyph(table, symbol));
    if (!use_ansi) {
        return text;
    }
    if (table.pad_under_ansi) {
        text += ' ';
    }
    return symbol_color(symbol) + text + colors::reset;
}

auto symbol_string(const Symbol& symbol, const RecorderOptions& options) -> std::string {
    return symbol_string(symbol, glyph_table(select_glyph_table(options)),
                         options.use_ansi_escape_codes);
}

} // namespace testrec::recorder
