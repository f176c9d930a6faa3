#pragma once

/**
 * @file
 * @brief Single connection attempt against an endpoint.
 */

#include "readygate/core/result.hpp"
#include "readygate/endpoint/endpoint.hpp"

#include <netdb.h>

#include <chrono>
#include <functional>
#include <optional>
#include <string_view>

namespace readygate::probe {

/**
 * @brief Result class of one probe.
 */
enum class probe_status {
    /// Endpoint accepted the connection.
    open,
    /// Not reachable yet; worth retrying.
    closed,
    /// Can never succeed as configured; not worth retrying.
    invalid,
};

/// @return `"open"`, `"closed"` or `"invalid"`.
[[nodiscard]] std::string_view to_string(probe_status value) noexcept;

/**
 * @brief Outcome of one probe, with the failure reason when not open.
 */
struct probe_outcome {
    probe_status status{probe_status::closed};
    std::optional<error> reason;

    [[nodiscard]] static probe_outcome open() noexcept;
    [[nodiscard]] static probe_outcome closed(error why) noexcept;
    [[nodiscard]] static probe_outcome invalid(error why) noexcept;
};

/**
 * @brief Tunables of a single probe.
 */
struct probe_options {
    /// Upper bound for the connect of one probe. Name resolution is not
    /// bounded by it.
    std::chrono::milliseconds timeout{std::chrono::seconds{5}};
    /// How long a UDP probe waits for an ICMP refusal after sending.
    std::chrono::milliseconds udp_grace{200};
};

/// Function performing one probe. Injectable for tests.
using probe_function = std::function<probe_outcome(const endpoint&)>;

/**
 * @brief Perform one connection attempt.
 *
 * - unknown: `invalid` without any I/O.
 * - tcp: nonblocking connect to every resolved address until one accepts;
 *   the socket is closed right after.
 * - udp: connect and send one empty datagram, then wait `udp_grace` for a
 *   refusal. UDP is connectionless, so `open` only means nothing rejected
 *   the datagram; a silent or absent listener also reports `open` unless
 *   the host answers with ICMP port unreachable.
 * - unix: connect to the socket at `path`; a missing file or refused
 *   connection is `closed`.
 *
 * Exactly one transient socket per resolved address is opened and it is
 * always closed before returning.
 */
[[nodiscard]] probe_outcome probe(const endpoint& target,
                                  const probe_options& options = {});

/// @return A `probe_function` bound to `options`.
[[nodiscard]] probe_function socket_prober(probe_options options = {});

/**
 * @brief Check that the host can create the socket kind a protocol needs.
 *
 * Run once at start-up, before any polling.
 */
[[nodiscard]] result<void> check_probe_support(protocol proto) noexcept;

namespace detail {

/**
 * @brief UDP probe over already resolved addresses, tried in order.
 *
 * The first address without a refusal is `open`; otherwise the outcome of
 * the last address is returned.
 */
[[nodiscard]] probe_outcome probe_udp_addresses(const addrinfo* addresses,
                                                const probe_options& options);

} // namespace detail

} // namespace readygate::probe
