#pragma once

/**
 * @file
 * @brief Diagnostic logger construction. All output goes to stderr so that
 * callers capturing stdout never see progress notices.
 */

#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>

#include <memory>
#include <string>

namespace readygate::log {

/**
 * @brief How much diagnostic output a run produces.
 */
enum class verbosity {
    /// Errors only.
    quiet,
    /// Endpoint up/down notices and warnings.
    normal,
    /// Every probe attempt.
    debug,
};

/// Logger name used by the CLI.
inline constexpr const char* kLoggerName = "readygate";

/**
 * @brief Create an unregistered logger writing to a stderr color sink.
 * @param level Output verbosity.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger(verbosity level);

/**
 * @brief Create an unregistered logger on a caller-provided sink.
 * @param level Output verbosity.
 * @param sink Destination sink.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger>
make_logger(verbosity level, spdlog::sink_ptr sink);

/// @return spdlog level matching a verbosity.
[[nodiscard]] spdlog::level::level_enum to_level(verbosity level) noexcept;

} // namespace readygate::log
