#pragma once

/**
 * @file
 * @brief RAII owner for the transient socket of a single probe.
 */

#include "readygate/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <sys/socket.h>

namespace readygate {

/**
 * @brief Readiness a caller waits for on a socket.
 */
enum class readiness {
    readable,
    writable,
};

/**
 * @brief Move-only owner of a socket descriptor.
 *
 * The descriptor is closed on destruction, so a probe releases its socket on
 * every exit path, including errors and timeouts.
 */
class socket_handle {
public:
    /// Construct an empty handle (`fd == -1`).
    socket_handle() noexcept = default;
    /// Take ownership of an existing descriptor.
    explicit socket_handle(int fd) noexcept;
    /// Close the descriptor if still owned.
    ~socket_handle() noexcept;

    socket_handle(const socket_handle&) = delete;
    socket_handle& operator=(const socket_handle&) = delete;

    socket_handle(socket_handle&& other) noexcept;
    socket_handle& operator=(socket_handle&& other) noexcept;

    /**
     * @brief Create a close-on-exec, nonblocking socket.
     * @param family Address family (`AF_INET`, `AF_INET6`, `AF_UNIX`).
     * @param type Socket type (`SOCK_STREAM`, `SOCK_DGRAM`).
     */
    [[nodiscard]] static result<socket_handle> open(int family,
                                                    int type) noexcept;

    /**
     * @brief Start a connect without blocking.
     * @return Success when the connect completed or is in progress.
     */
    [[nodiscard]] result<void> start_connect(const sockaddr* addr,
                                             socklen_t addr_len) noexcept;
    /**
     * @brief Wait for the descriptor to become ready.
     * @param what Readiness to wait for.
     * @param timeout Maximum wait.
     * @return `true` when ready, `false` when the wait timed out.
     */
    [[nodiscard]] result<bool> wait(readiness what,
                                    std::chrono::milliseconds timeout) noexcept;
    /// @brief Fetch and clear the pending socket error (`SO_ERROR`).
    [[nodiscard]] result<void> take_pending_error() noexcept;
    /// @brief Send a zero-length datagram on a connected socket.
    [[nodiscard]] result<void> send_empty() noexcept;

    /// @return Owned descriptor or `-1`.
    [[nodiscard]] int get() const noexcept;
    /// @return `true` when a valid descriptor is owned.
    [[nodiscard]] bool valid() const noexcept;
    /// Close the owned descriptor, if any.
    void reset() noexcept;

private:
    int fd_{-1};
};

/**
 * @brief Put a descriptor into nonblocking mode.
 * @param fd Descriptor to update.
 */
[[nodiscard]] result<void> set_nonblocking(int fd) noexcept;

} // namespace readygate
