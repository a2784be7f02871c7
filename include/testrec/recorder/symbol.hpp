//! # Output Symbols
//!
//! The glyph printed at the start of every recorder line, and the tables
//! that map symbols to glyphs.
//!
//! | Symbol        | Unicode | Windows console | ANSI color   |
//! |---------------|---------|-----------------|--------------|
//! | default       | ◇       | ◊               | gray         |
//! | skip          | ✘       | ×               | gray         |
//! | pass          | ✔       | √               | bright green |
//! | pass (known)  | ✘       | ×               | gray         |
//! | fail          | ✘       | ×               | bright red   |
//! | difference    | ±       | ±               | gray         |
//! | warning       | ⚠︎       | !               | bright yellow|
//!
//! A third table holds SF Symbols code points for platforms that ship the
//! SF Symbols font. Every table is compiled on every platform; options and
//! platform support only decide which one is used.

#pragma once

#include "testrec/recorder/options.hpp"

#include <string>
#include <string_view>

namespace testrec::recorder {

// ============================================================================
// Symbols
// ============================================================================

enum class SymbolKind { Default, Skip, Pass, Fail, Difference, Warning };

/// A line prefix describing an outcome.
struct Symbol {
    SymbolKind kind = SymbolKind::Default;

    /// Only meaningful for Pass: the test passed, but with known issues.
    bool has_known_issues = false;

    static constexpr auto default_symbol() -> Symbol {
        return {SymbolKind::Default, false};
    }
    static constexpr auto skip() -> Symbol {
        return {SymbolKind::Skip, false};
    }
    static constexpr auto pass(bool has_known_issues = false) -> Symbol {
        return {SymbolKind::Pass, has_known_issues};
    }
    static constexpr auto fail() -> Symbol {
        return {SymbolKind::Fail, false};
    }
    static constexpr auto difference() -> Symbol {
        return {SymbolKind::Difference, false};
    }
    static constexpr auto warning() -> Symbol {
        return {SymbolKind::Warning, false};
    }

    bool operator==(const Symbol&) const = default;
};

// ============================================================================
// Glyph Tables
// ============================================================================

enum class GlyphTableKind { Unicode, WindowsConsole, SFSymbols };

/// UTF-8 glyphs for each symbol plus the comment arrow.
struct GlyphTable {
    std::string_view default_symbol;
    std::string_view skip;
    std::string_view pass;
    std::string_view pass_with_known_issues;
    std::string_view fail;
    std::string_view difference;
    std::string_view warning;
    std::string_view comment_arrow;

    /// SF Symbols glyphs render double-width; with ANSI output they need a
    /// trailing space to stay aligned.
    bool pad_under_ansi = false;
};

[[nodiscard]] auto glyph_table(GlyphTableKind kind) -> const GlyphTable&;

/// True on platforms where SF Symbols are available (Apple).
[[nodiscard]] auto platform_supports_sf_symbols() -> bool;

/// The table `options` selects on this platform: SF Symbols when requested
/// and available, otherwise the platform's fallback table.
[[nodiscard]] auto select_glyph_table(const RecorderOptions& options) -> GlyphTableKind;

/// The raw glyph for `symbol` in `table`.
[[nodiscard]] auto glyph(const GlyphTable& table, const Symbol& symbol) -> std::string_view;

/// The ANSI color `symbol` is drawn in.
[[nodiscard]] auto symbol_color(const Symbol& symbol) -> const char*;

/// The glyph for `symbol` in `table`, wrapped in its color and a reset when
/// `use_ansi` is set.
[[nodiscard]] auto symbol_string(const Symbol& symbol, const GlyphTable& table, bool use_ansi)
    -> std::string;

/// `symbol_string` using the table and ANSI setting from `options`.
[[nodiscard]] auto symbol_string(const Symbol& symbol, const RecorderOptions& options)
    -> std::string;

} // namespace testrec::recorder
