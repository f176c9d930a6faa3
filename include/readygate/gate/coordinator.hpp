#pragma once

/**
 * @file
 * @brief Concurrent wait over a list of endpoints.
 */

#include "readygate/poll/poller.hpp"
#include "readygate/probe/prober.hpp"

#include <spdlog/logger.h>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace readygate::gate {

/**
 * @brief Aggregate over every endpoint of one invocation.
 */
struct overall_result {
    /// One entry per input endpoint, in input order.
    std::vector<poll::poll_result> results;

    /// @return `true` iff every endpoint succeeded (vacuously for none).
    [[nodiscard]] bool all_up() const noexcept;
    /// @return Raw strings of endpoints that did not come up, in input order.
    [[nodiscard]] std::vector<std::string> failed() const;
};

struct wait_options {
    /// Budget shared by all endpoints without an override.
    std::chrono::seconds timeout{30};
    /// Per-endpoint budgets keyed by raw endpoint text.
    std::map<std::string, std::chrono::seconds> timeout_overrides{};
    /// Pause between probes of one endpoint.
    std::chrono::milliseconds interval{std::chrono::seconds{1}};
    probe::probe_options probe{};
    /// Replaces the socket prober when set.
    probe::probe_function prober{};
    /// Progress notices; null suppresses them.
    std::shared_ptr<spdlog::logger> logger{};
};

/// @return The budget that applies to `raw` under `options`.
[[nodiscard]] std::chrono::seconds timeout_for(const std::string& raw,
                                               const wait_options& options);

/**
 * @brief Wait until every endpoint is reachable or has exhausted its budget.
 *
 * No endpoints succeed at once. A single endpoint is polled on the calling
 * thread. Several endpoints each get their own thread; all of them run to
 * completion, so a timeout never cuts a sibling short.
 *
 * @throws std::system_error when a poller thread cannot be started; pollers
 * already running are joined first.
 */
[[nodiscard]] overall_result wait_for_all(const std::vector<std::string>& raw_endpoints,
                                          const wait_options& options);

} // namespace readygate::gate
