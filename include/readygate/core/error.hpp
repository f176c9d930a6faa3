#pragma once

/**
 * @file
 * @brief Error values shared by the parser, prober and gate.
 */

#include <cerrno>
#include <string>
#include <system_error>

namespace readygate {

/**
 * @brief Domain failure codes that have no errno equivalent.
 */
enum class errc {
    missing_protocol = 1,
    missing_target,
    missing_host,
    missing_port,
    unsupported_protocol,
    invalid_port,
    path_too_long,
    unsupported_platform,
    invalid_argument,
    timed_out,
};

/// @return Category for `readygate::errc` codes.
[[nodiscard]] const std::error_category& readygate_category() noexcept;

/// Allow `std::error_code ec = errc::missing_host;`.
[[nodiscard]] std::error_code make_error_code(errc value) noexcept;

/**
 * @brief Error value used across `result<T>`.
 *
 * Wraps `std::error_code` so that errno failures from the socket layer and
 * domain failures from parsing share one type.
 */
class error {
public:
    /// Construct a success-like empty error (`value() == 0`).
    error() noexcept = default;
    /// Construct from an explicit error code.
    explicit error(std::error_code code) noexcept;
    /// Construct from a domain code.
    explicit error(errc value) noexcept;

    /**
     * @brief Build an error from errno.
     * @param value errno value. Defaults to current `errno`.
     */
    [[nodiscard]] static error from_errno(int value = errno) noexcept;

    /// @return Underlying `std::error_code`.
    [[nodiscard]] std::error_code code() const noexcept;
    /// @return Integer code value.
    [[nodiscard]] int value() const noexcept;
    /// @return Human-readable message for the code.
    [[nodiscard]] std::string message() const;
    /// @return `true` when the error carries the given domain code.
    [[nodiscard]] bool is(errc value) const noexcept;

private:
    std::error_code code_;
};

/// Convenience helper that wraps an errno value into `error`.
[[nodiscard]] error make_error_from_errno(int value) noexcept;

} // namespace readygate

template <>
struct std::is_error_code_enum<readygate::errc> : std::true_type {};
