#pragma once

/**
 * @file
 * @brief Producers of the raw endpoint list handed to the gate.
 */

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace readygate::source {

/// Produces raw endpoint strings.
using endpoint_source = std::function<std::vector<std::string>()>;

/// @return A source yielding `endpoints` verbatim.
[[nodiscard]] endpoint_source from_arguments(std::vector<std::string> endpoints);

/**
 * @brief A source scanning `KEY=VALUE` entries for service link variables.
 *
 * A key matches when it reads `<SERVICE>_<INDEX>_PORT` with a non-empty
 * SERVICE and an all-digit INDEX (`DB_1_PORT=tcp://10.0.0.5:5432`). Values
 * are de-duplicated and returned sorted.
 */
[[nodiscard]] endpoint_source from_environment(std::vector<std::string> entries);

/// @return `true` when `key` has the `<SERVICE>_<INDEX>_PORT` shape.
[[nodiscard]] bool is_service_port_key(std::string_view key) noexcept;

/// @return Snapshot of the process environment as `KEY=VALUE` entries.
[[nodiscard]] std::vector<std::string> capture_environment();

} // namespace readygate::source
