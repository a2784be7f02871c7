//! # Common Definitions
//!
//! Version constants and the `Result` type shared by every testrec module.
//!
//! testrec reports recoverable failures through `Result<T, E>` rather than
//! exceptions. The render path itself has nothing that can fail; `Result`
//! shows up in configuration parsing.

#ifndef TESTREC_COMMON_HPP
#define TESTREC_COMMON_HPP

#include <string>
#include <variant>

namespace testrec {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.1.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// ```cpp
/// Result<TagColor> color = parse_tag_color("#ff8000");
/// if (is_ok(color)) {
///     bindings[tag] = unwrap(color);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace testrec

#endif // TESTREC_COMMON_HPP
