//! # Terminal Capability Detection
//!
//! Decides whether a standard stream is an interactive terminal that
//! understands ANSI escape codes, and whether it advertises 256 colors.

#pragma once

#include <cstdio>
#include <string>

namespace testrec {

/// Value of environment variable `name`, or an empty string if unset.
std::string get_env(const char* name);

/// True if `stream` is attached to a terminal.
bool is_terminal(std::FILE* stream);

/// True if `stream` is a terminal and `TERM` is set to something other than
/// "dumb". On Windows, tries to switch the console into virtual terminal mode.
bool terminal_supports_colors(std::FILE* stream);

/// True if `TERM` names a 256-color terminal or `COLORTERM` reports
/// truecolor/24bit support.
bool terminal_supports_256_colors();

} // namespace testrec
