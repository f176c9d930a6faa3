#include "readygate/core/socket_handle.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <limits>
#include <poll.h>
#include <unistd.h>
#include <utility>

namespace readygate {

socket_handle::socket_handle(int fd) noexcept : fd_(fd) {}

socket_handle::~socket_handle() noexcept {
    reset();
}

socket_handle::socket_handle(socket_handle&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

socket_handle& socket_handle::operator=(socket_handle&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

result<socket_handle> socket_handle::open(int family, int type) noexcept {
    int fd = ::socket(family, type | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    if (fd >= 0) {
        return socket_handle{fd};
    }

    fd = ::socket(family, type | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return err<socket_handle>(error::from_errno());
    }

    socket_handle owned{fd};
    const auto status = set_nonblocking(owned.get());
    if (!status.has_value()) {
        return err<socket_handle>(status.error());
    }
    return owned;
}

result<void> socket_handle::start_connect(const sockaddr* addr,
                                          socklen_t addr_len) noexcept {
    if (!valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }

    while (::connect(fd_, addr, addr_len) != 0) {
        if (errno == EINTR) {
            continue;
        }
        if (errno == EINPROGRESS) {
            return ok();
        }
        return err<void>(error::from_errno());
    }
    return ok();
}

result<bool> socket_handle::wait(readiness what,
                                 std::chrono::milliseconds timeout) noexcept {
    if (!valid()) {
        return err<bool>(make_error_from_errno(EBADF));
    }

    pollfd entry{};
    entry.fd = fd_;
    entry.events = what == readiness::readable ? POLLIN : POLLOUT;

    const auto clamped = std::clamp<long long>(
        timeout.count(), 0,
        static_cast<long long>(std::numeric_limits<int>::max()));

    int ready = 0;
    do {
        ready = ::poll(&entry, 1, static_cast<int>(clamped));
    } while (ready < 0 && errno == EINTR);

    if (ready < 0) {
        return err<bool>(error::from_errno());
    }
    return ready > 0;
}

result<void> socket_handle::take_pending_error() noexcept {
    if (!valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }

    int socket_error = 0;
    auto error_len = static_cast<socklen_t>(sizeof(socket_error));
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &socket_error, &error_len) !=
        0) {
        return err<void>(error::from_errno());
    }
    if (socket_error == 0) {
        return ok();
    }
    return err<void>(make_error_from_errno(socket_error));
}

result<void> socket_handle::send_empty() noexcept {
    if (!valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }

    while (::send(fd_, nullptr, 0, MSG_NOSIGNAL) < 0) {
        if (errno == EINTR) {
            continue;
        }
        return err<void>(error::from_errno());
    }
    return ok();
}

int socket_handle::get() const noexcept {
    return fd_;
}

bool socket_handle::valid() const noexcept {
    return fd_ >= 0;
}

void socket_handle::reset() noexcept {
    if (valid()) {
        (void)::close(fd_);
    }
    fd_ = -1;
}

result<void> set_nonblocking(int fd) noexcept {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return err<void>(error::from_errno());
    }
    if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
        return err<void>(error::from_errno());
    }
    return ok();
}

} // namespace readygate
