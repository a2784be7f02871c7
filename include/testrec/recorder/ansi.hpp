//! # ANSI Escape Codes
//!
//! SGR sequences used by the recorder's output.

#pragma once

namespace testrec::recorder {

namespace colors {
inline constexpr const char* escape_prefix = "\033[";
inline constexpr const char* reset = "\033[0m";
inline constexpr const char* gray = "\033[90m";
inline constexpr const char* bright_red = "\033[91m";
inline constexpr const char* bright_green = "\033[92m";
inline constexpr const char* bright_yellow = "\033[93m";
inline constexpr const char* bright_blue = "\033[94m";
inline constexpr const char* bright_magenta = "\033[95m";
inline constexpr const char* yellow = "\033[33m";
} // namespace colors

} // namespace testrec::recorder
