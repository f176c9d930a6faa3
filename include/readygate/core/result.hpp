#pragma once

/**
 * @file
 * @brief `std::expected` based result alias.
 */

#include "readygate/core/error.hpp"

#include <expected>
#include <type_traits>
#include <utility>

namespace readygate {

/**
 * @brief Operation result type used by the library.
 * @tparam T Success value type.
 */
template <class T>
using result = std::expected<T, error>;

/// @brief Construct a successful `result<void>`.
[[nodiscard]] constexpr result<void> ok() {
    return result<void>{};
}

/**
 * @brief Construct an error result.
 * @tparam T Success value type.
 * @param e Error value.
 */
template <class T>
[[nodiscard]] constexpr result<T> err(error e) {
    return std::unexpected<error>{e};
}

/// @brief Construct an error result from a domain code.
template <class T>
[[nodiscard]] result<T> err(errc value) {
    return std::unexpected<error>{error{value}};
}

} // namespace readygate
