#pragma once

/**
 * @file
 * @brief Timeout-bounded retry loop around the prober for one endpoint.
 */

#include "readygate/endpoint/endpoint.hpp"
#include "readygate/probe/prober.hpp"

#include <spdlog/logger.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace readygate::poll {

/**
 * @brief Terminal outcome of polling one endpoint.
 */
enum class poll_status {
    succeeded,
    timed_out,
};

/**
 * @brief Per-endpoint result, read once by the coordinator.
 */
struct poll_result {
    /// Raw endpoint text.
    std::string endpoint;
    poll_status status{poll_status::timed_out};
    /// Number of probes performed.
    int attempts{0};
    /// Wall time spent polling.
    std::chrono::milliseconds elapsed{0};
    /// Set when the endpoint was rejected without burning its budget.
    std::optional<error> problem;

    [[nodiscard]] bool succeeded() const noexcept {
        return status == poll_status::succeeded;
    }
};

struct poll_options {
    /// Budget in probe intervals; 0 means one probe and no retry.
    std::chrono::seconds timeout{30};
    /// Pause after a `closed` probe. Not compensated for probe duration.
    std::chrono::milliseconds interval{std::chrono::seconds{1}};
    /// Used when `prober` is empty.
    probe::probe_options probe{};
    /// Replaces the socket prober, mostly in tests.
    probe::probe_function prober{};
    /// Receives one debug line per attempt. May be null.
    std::shared_ptr<spdlog::logger> logger{};
};

/**
 * @brief Probe `target` until it is open or the budget runs out.
 *
 * An endpoint that failed to parse is rejected without probing. An `open`
 * probe returns `succeeded` at once. An `invalid` probe returns
 * `timed_out` at once with `problem` set. A `closed` probe is followed by a
 * sleep of `interval` and another attempt, until `timeout` intervals have
 * elapsed; the last attempt happens when the budget is reached. Blocks the
 * calling thread.
 */
[[nodiscard]] poll_result poll_until_open(const endpoint& target,
                                          const poll_options& options);

} // namespace readygate::poll
