#pragma once

/**
 * @file
 * @brief Endpoint strings (`tcp://host:port`, `udp://host:port`,
 * `unix://path`) and their parsed form.
 */

#include "readygate/core/error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace readygate {

/**
 * @brief Transport used to reach an endpoint.
 */
enum class protocol {
    tcp,
    udp,
    unix_socket,
    unknown,
};

/// @return Scheme text for a protocol (`"tcp"`, `"udp"`, `"unix"`, `"unknown"`).
[[nodiscard]] std::string_view to_string(protocol value) noexcept;

/**
 * @brief Immutable parsed endpoint.
 *
 * `host`/`port` are set for tcp and udp, `path` for unix. When `proto` is
 * `protocol::unknown` the endpoint is never connected to and `problem`
 * says why.
 */
struct endpoint {
    /// Text the endpoint was parsed from.
    std::string raw;
    /// Transport tag.
    protocol proto{protocol::unknown};
    /// Host name or address literal (tcp/udp).
    std::string host;
    /// Port number or service name, verbatim (tcp/udp).
    std::string port;
    /// Filesystem path of the socket (unix).
    std::string path;
    /// Why the endpoint cannot be probed, if it cannot.
    std::optional<error> problem;

    /// @return `true` when the endpoint can be probed.
    [[nodiscard]] bool valid() const noexcept;
};

/**
 * @brief Parse an endpoint string. Never fails; malformed input yields an
 * endpoint with `protocol::unknown` and `problem` set.
 *
 * The scheme is everything before the first `://`. For tcp and udp the host
 * and port are split on the last colon of the whole string, so hosts that
 * contain colons (IPv6 literals) are not specially handled.
 *
 * @param raw Endpoint text.
 */
[[nodiscard]] endpoint parse_endpoint(std::string_view raw);

} // namespace readygate
