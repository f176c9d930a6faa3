#pragma once

/**
 * @file
 * @brief Command-line options and the `readygate` entry point.
 */

#include "readygate/gate/coordinator.hpp"
#include "readygate/log.hpp"

#include <spdlog/logger.h>

#include <chrono>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace readygate::cli {

/// Process exit statuses.
inline constexpr int kExitAllUp = 0;
inline constexpr int kExitFailed = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitUnsupported = 3;

/**
 * @brief Settings of one invocation.
 */
struct options {
    std::chrono::seconds timeout{30};
    std::chrono::seconds probe_timeout{5};
    std::map<std::string, std::chrono::seconds> endpoint_timeouts{};
    bool debug{false};
    bool quiet{false};
    bool help{false};
    /// Positional endpoints; empty means "discover from the environment".
    std::vector<std::string> endpoints{};
};

/**
 * @brief Human-readable reason a command line was rejected.
 */
struct usage_error {
    std::string message;
};

/**
 * @brief Parse arguments (without the program name).
 *
 * `READYGATE_TIMEOUT`, `READYGATE_DEBUG` and `READYGATE_QUIET` from
 * `environment` (`KEY=VALUE` entries) provide defaults that the arguments
 * override.
 */
[[nodiscard]] std::expected<options, usage_error>
parse_command_line(const std::vector<std::string>& args,
                   const std::vector<std::string>& environment = {});

/// @return Usage text, ending in a newline.
[[nodiscard]] std::string usage();

/// @return Verbosity selected by `opts`; `debug` wins over `quiet`.
[[nodiscard]] log::verbosity verbosity_of(const options& opts) noexcept;

/// @return Gate settings derived from `opts`.
[[nodiscard]] gate::wait_options
to_wait_options(const options& opts, std::shared_ptr<spdlog::logger> logger);

/**
 * @brief Run a full invocation and return the process exit status.
 * @param args Arguments without the program name.
 * @param environment Process environment as `KEY=VALUE` entries.
 */
[[nodiscard]] int run(const std::vector<std::string>& args,
                      const std::vector<std::string>& environment);

} // namespace readygate::cli
