#include "readygate/probe/prober.hpp"

#include "readygate/core/socket_handle.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <netdb.h>
#include <string>
#include <sys/un.h>
#include <utility>

namespace readygate::probe {

namespace {

using probe_clock = std::chrono::steady_clock;

// Keeps deadline arithmetic far from the clock's range limits.
constexpr std::chrono::milliseconds kMaxProbeTimeout{std::chrono::hours{24}};

// The first address always gets at least this long, even with a zero timeout.
constexpr std::chrono::milliseconds kMinimumConnectWait{100};

struct addrinfo_deleter {
    void operator()(addrinfo* list) const noexcept {
        if (list != nullptr) {
            ::freeaddrinfo(list);
        }
    }
};

using addrinfo_list = std::unique_ptr<addrinfo, addrinfo_deleter>;

probe_clock::time_point deadline_after(std::chrono::milliseconds timeout) {
    return probe_clock::now() +
           std::clamp(timeout, std::chrono::milliseconds{0}, kMaxProbeTimeout);
}

std::chrono::milliseconds remaining(probe_clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - probe_clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

// Numeric ports must fit in 1..65535; anything else is left to the
// services database.
bool numeric_port_out_of_range(const std::string& port) {
    if (port.empty() || !std::all_of(port.begin(), port.end(),
                     [](char ch) { return ch >= '0' && ch <= '9'; })) {
        return false;
    }
    if (port.size() > 5) {
        return true;
    }
    const unsigned long value = std::stoul(port);
    return value == 0 || value > 65535;
}

// Resolution failures that may clear up later (DNS not ready yet) are
// `closed`; an unusable port is `invalid`.
std::pair<addrinfo_list, std::optional<probe_outcome>>
resolve(const endpoint& target, int socktype) {
    if (numeric_port_out_of_range(target.port)) {
        return {nullptr, probe_outcome::invalid(error{errc::invalid_port})};
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = socktype;

    addrinfo* raw_result = nullptr;
    const int status = ::getaddrinfo(target.host.c_str(), target.port.c_str(),
                                     &hints, &raw_result);
    addrinfo_list resolved{raw_result};
    if (status == 0 && resolved != nullptr) {
        return {std::move(resolved), std::nullopt};
    }

    if (status == EAI_SERVICE) {
        return {nullptr, probe_outcome::invalid(error{errc::invalid_port})};
    }

    int mapped = EHOSTUNREACH;
    if      (status == EAI_AGAIN)  { mapped = EAGAIN; }
    else if (status == EAI_NONAME) { mapped = ENOENT; }
    else if (status == EAI_MEMORY) { mapped = ENOMEM; }
    else if (status == EAI_SYSTEM) { mapped = errno; }
    return {nullptr, probe_outcome::closed(make_error_from_errno(mapped))};
}

// Connect, wait for completion and read back the final socket error.
result<void> connect_within(socket_handle& sock, const sockaddr* addr,
                            socklen_t addr_len, probe_clock::time_point deadline) {
    const auto started = sock.start_connect(addr, addr_len);
    if (!started.has_value()) {
        return started;
    }

    const auto ready = sock.wait(readiness::writable, remaining(deadline));
    if (!ready.has_value()) {
        return err<void>(ready.error());
    }
    if (!ready.value()) {
        return err<void>(make_error_from_errno(ETIMEDOUT));
    }
    return sock.take_pending_error();
}

probe_outcome probe_tcp(const endpoint& target, const probe_options& options) {
    const auto deadline = deadline_after(options.timeout);
    auto [addresses, failure] = resolve(target, SOCK_STREAM);
    if (failure.has_value()) {
        return *failure;
    }

    error last_error = make_error_from_errno(ETIMEDOUT);
    for (const addrinfo* cursor = addresses.get(); cursor != nullptr;
         cursor = cursor->ai_next) {
        const bool first = cursor == addresses.get();
        if (!first && remaining(deadline).count() == 0) {
            break;
        }

        auto sock = socket_handle::open(cursor->ai_family, SOCK_STREAM);
        if (!sock.has_value()) {
            last_error = sock.error();
            continue;
        }

        const auto attempt_deadline =
            first ? std::max(deadline, probe_clock::now() + kMinimumConnectWait)
                  : deadline;
        const auto connected = connect_within(sock.value(), cursor->ai_addr,
                                              cursor->ai_addrlen,
                                              attempt_deadline);
        if (connected.has_value()) {
            return probe_outcome::open();
        }
        last_error = connected.error();
    }
    return probe_outcome::closed(last_error);
}

probe_outcome probe_udp_address(const addrinfo& address,
                                const probe_options& options) {
    auto sock = socket_handle::open(address.ai_family, SOCK_DGRAM);
    if (!sock.has_value()) {
        return probe_outcome::closed(sock.error());
    }

    const auto connected = sock->start_connect(address.ai_addr, address.ai_addrlen);
    if (!connected.has_value()) {
        return probe_outcome::closed(connected.error());
    }

    const auto sent = sock->send_empty();
    if (!sent.has_value()) {
        return probe_outcome::closed(sent.error());
    }

    // An ICMP port unreachable shows up as POLLERR plus a pending
    // ECONNREFUSED. Silence within the grace window counts as open.
    const auto ready = sock->wait(readiness::readable, options.udp_grace);
    if (!ready.has_value()) {
        return probe_outcome::closed(ready.error());
    }

    const auto pending = sock->take_pending_error();
    if (!pending.has_value()) {
        return probe_outcome::closed(pending.error());
    }
    return probe_outcome::open();
}

probe_outcome probe_udp(const endpoint& target, const probe_options& options) {
    auto [addresses, failure] = resolve(target, SOCK_DGRAM);
    if (failure.has_value()) {
        return *failure;
    }
    return detail::probe_udp_addresses(addresses.get(), options);
}

probe_outcome probe_unix(const endpoint& target, const probe_options& options) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (target.path.size() >= sizeof(addr.sun_path)) {
        return probe_outcome::invalid(error{errc::path_too_long});
    }
    std::memcpy(addr.sun_path, target.path.data(), target.path.size());

    const auto deadline = deadline_after(options.timeout);
    const auto* sa = reinterpret_cast<const sockaddr*>(&addr);
    const auto sa_len = static_cast<socklen_t>(sizeof(addr));

    auto sock = socket_handle::open(AF_UNIX, SOCK_STREAM);
    if (!sock.has_value()) {
        return probe_outcome::closed(sock.error());
    }

    auto connected = connect_within(sock.value(), sa, sa_len, deadline);
    if (!connected.has_value() && connected.error().value() == EPROTOTYPE) {
        // The listener is a datagram socket.
        sock = socket_handle::open(AF_UNIX, SOCK_DGRAM);
        if (!sock.has_value()) {
            return probe_outcome::closed(sock.error());
        }
        connected = connect_within(sock.value(), sa, sa_len, deadline);
    }

    if (!connected.has_value()) {
        return probe_outcome::closed(connected.error());
    }
    return probe_outcome::open();
}

result<void> try_socket(int family, int type) noexcept {
    auto sock = socket_handle::open(family, type);
    if (!sock.has_value()) {
        return err<void>(sock.error());
    }
    return ok();
}

} // namespace

namespace detail {

probe_outcome probe_udp_addresses(const addrinfo* addresses,
                                  const probe_options& options) {
    probe_outcome last = probe_outcome::closed(make_error_from_errno(EHOSTUNREACH));
    for (const addrinfo* cursor = addresses; cursor != nullptr;
         cursor = cursor->ai_next) {
        last = probe_udp_address(*cursor, options);
        if (last.status == probe_status::open) {
            return last;
        }
    }
    return last;
}

} // namespace detail

std::string_view to_string(probe_status value) noexcept {
    switch (value) {
    case probe_status::open:
        return "open";
    case probe_status::closed:
        return "closed";
    case probe_status::invalid:
        return "invalid";
    }
    return "invalid";
}

probe_outcome probe_outcome::open() noexcept {
    return probe_outcome{probe_status::open, std::nullopt};
}

probe_outcome probe_outcome::closed(error why) noexcept {
    return probe_outcome{probe_status::closed, why};
}

probe_outcome probe_outcome::invalid(error why) noexcept {
    return probe_outcome{probe_status::invalid, why};
}

probe_outcome probe(const endpoint& target, const probe_options& options) {
    switch (target.proto) {
    case protocol::tcp:
        return probe_tcp(target, options);
    case protocol::udp:
        return probe_udp(target, options);
    case protocol::unix_socket:
        return probe_unix(target, options);
    case protocol::unknown:
        return probe_outcome::invalid(
            target.problem.value_or(error{errc::unsupported_protocol}));
    }
    return probe_outcome::invalid(error{errc::unsupported_protocol});
}

probe_function socket_prober(probe_options options) {
    return [options](const endpoint& target) { return probe(target, options); };
}

result<void> check_probe_support(protocol proto) noexcept {
    switch (proto) {
    case protocol::tcp:
    case protocol::udp: {
        const int type = proto == protocol::tcp ? SOCK_STREAM : SOCK_DGRAM;
        const auto v4 = try_socket(AF_INET, type);
        if (v4.has_value()) {
            return v4;
        }
        if (try_socket(AF_INET6, type).has_value()) {
            return ok();
        }
        return v4;
    }
    case protocol::unix_socket:
        return try_socket(AF_UNIX, SOCK_STREAM);
    case protocol::unknown:
        return ok();
    }
    return err<void>(errc::unsupported_platform);
}

} // namespace readygate::probe
