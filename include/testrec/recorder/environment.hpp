//! # Environment Description
//!
//! Version strings printed under the "Test run started." banner.

#pragma once

#include <string>

namespace testrec::recorder {

/// "testrec <version>".
[[nodiscard]] auto library_version() -> std::string;

/// Compiler name and version plus the C++ standard in use, e.g.
/// "GCC 13.2.0 (C++20)".
[[nodiscard]] auto compiler_version() -> std::string;

/// Operating system name, release and machine, e.g.
/// "Linux 6.8.0 x86_64". Falls back to the platform name alone.
[[nodiscard]] auto operating_system_version() -> std::string;

} // namespace testrec::recorder
