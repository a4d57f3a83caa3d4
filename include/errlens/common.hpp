//! # Common Definitions
//!
//! Version string and the `Result` type shared by every errlens component.
//!
//! Contract violations (a malformed error kind, an unknown capture group)
//! throw. Failures a caller is expected to handle, such as an unreadable
//! config file or a validation pattern that does not compile, are returned
//! as a `Result`.

#ifndef ERRLENS_COMMON_HPP
#define ERRLENS_COMMON_HPP

#include <string>
#include <variant>

namespace errlens {

constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Result Type
// ============================================================================

/// Success value or error.
///
/// ```cpp
/// auto config = load_config("errlens.toml");
/// if (is_err(config)) {
///     std::cerr << unwrap_err(config) << "\n";
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

/// Throws `std::bad_variant_access` if the Result holds an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Throws `std::bad_variant_access` if the Result holds a value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace errlens

#endif // ERRLENS_COMMON_HPP
