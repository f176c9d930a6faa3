#pragma once

#include "readygate/core/socket_handle.hpp"

#include <arpa/inet.h>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <netdb.h>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace readygate::test_support {

/// Socket bound to an ephemeral 127.0.0.1 port.
struct loopback_socket {
    socket_handle sock;
    std::uint16_t port{};

    [[nodiscard]] std::string url(const char* scheme) const {
        return std::string{scheme} + "://127.0.0.1:" + std::to_string(port);
    }
};

inline loopback_socket bind_loopback(int type) {
    auto opened = socket_handle::open(AF_INET, type);
    if (!opened.has_value()) {
        throw std::runtime_error("socket: " + opened.error().message());
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::bind(opened->get(), reinterpret_cast<const sockaddr*>(&addr),
               sizeof(addr)) != 0) {
        throw std::runtime_error("bind failed");
    }

    auto addr_len = static_cast<socklen_t>(sizeof(addr));
    if (::getsockname(opened->get(), reinterpret_cast<sockaddr*>(&addr),
                      &addr_len) != 0) {
        throw std::runtime_error("getsockname failed");
    }
    return loopback_socket{std::move(opened.value()), ntohs(addr.sin_port)};
}

/// TCP listener; the kernel completes handshakes without `accept`.
inline loopback_socket listen_tcp() {
    auto bound = bind_loopback(SOCK_STREAM);
    if (::listen(bound.sock.get(), 16) != 0) {
        throw std::runtime_error("listen failed");
    }
    return bound;
}

inline loopback_socket bind_udp() {
    return bind_loopback(SOCK_DGRAM);
}

/// Bound but not listening: connects are refused for as long as it lives.
inline loopback_socket reserve_tcp_port() {
    return bind_loopback(SOCK_STREAM);
}

/// A UDP port nothing is bound to (bound once, then released).
inline std::uint16_t unused_udp_port() {
    return bind_loopback(SOCK_DGRAM).port;
}

inline sockaddr_in loopback_address(std::uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    return addr;
}

/// Two-entry `addrinfo` list over caller-owned addresses, as a resolver
/// would return for a name with several addresses.
class udp_address_chain {
public:
    udp_address_chain(sockaddr_in& first, sockaddr_in& second) {
        link(entries_[0], first);
        link(entries_[1], second);
        entries_[0].ai_next = &entries_[1];
    }

    udp_address_chain(const udp_address_chain&) = delete;
    udp_address_chain& operator=(const udp_address_chain&) = delete;

    [[nodiscard]] const addrinfo* head() const noexcept {
        return &entries_[0];
    }

private:
    static void link(addrinfo& entry, sockaddr_in& addr) {
        entry = addrinfo{};
        entry.ai_family = AF_INET;
        entry.ai_socktype = SOCK_DGRAM;
        entry.ai_protocol = IPPROTO_UDP;
        entry.ai_addrlen = sizeof(addr);
        entry.ai_addr = reinterpret_cast<sockaddr*>(&addr);
    }

    addrinfo entries_[2]{};
};

/// Unique socket path under the temp directory; removed on destruction.
class temp_socket_path {
public:
    explicit temp_socket_path(const std::string& stem)
        : path_((std::filesystem::temp_directory_path() /
                 (stem + "-" + std::to_string(::getpid()) + "-" +
                  std::to_string(counter()++) + ".sock"))
                    .string()) {
        std::filesystem::remove(path_);
    }
    ~temp_socket_path() {
        std::error_code ignored;
        std::filesystem::remove(path_, ignored);
    }

    temp_socket_path(const temp_socket_path&) = delete;
    temp_socket_path& operator=(const temp_socket_path&) = delete;

    [[nodiscard]] const std::string& path() const noexcept {
        return path_;
    }
    [[nodiscard]] std::string url() const {
        return "unix://" + path_;
    }

private:
    static int& counter() {
        static int value = 0;
        return value;
    }

    std::string path_;
};

inline socket_handle listen_unix(const std::string& path, int type = SOCK_STREAM) {
    auto opened = socket_handle::open(AF_UNIX, type);
    if (!opened.has_value()) {
        throw std::runtime_error("socket: " + opened.error().message());
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.data(), path.size());
    if (::bind(opened->get(), reinterpret_cast<const sockaddr*>(&addr),
               sizeof(addr)) != 0) {
        throw std::runtime_error("bind failed for " + path);
    }
    if (type == SOCK_STREAM && ::listen(opened->get(), 16) != 0) {
        throw std::runtime_error("listen failed for " + path);
    }
    return std::move(opened.value());
}

} // namespace readygate::test_support
