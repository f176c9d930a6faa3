#include "readygate/endpoint/endpoint.hpp"

namespace readygate {

namespace {

constexpr std::string_view kSchemeSeparator = "://";

endpoint make_invalid(std::string_view raw, errc reason) {
    endpoint parsed{};
    parsed.raw = std::string{raw};
    parsed.proto = protocol::unknown;
    parsed.problem = error{reason};
    return parsed;
}

} // namespace

std::string_view to_string(protocol value) noexcept {
    switch (value) {
    case protocol::tcp:
        return "tcp";
    case protocol::udp:
        return "udp";
    case protocol::unix_socket:
        return "unix";
    case protocol::unknown:
        return "unknown";
    }
    return "unknown";
}

bool endpoint::valid() const noexcept {
    return proto != protocol::unknown && !problem.has_value();
}

endpoint parse_endpoint(std::string_view raw) {
    const std::size_t separator = raw.find(kSchemeSeparator);
    if (separator == std::string_view::npos || separator == 0) {
        return make_invalid(raw, errc::missing_protocol);
    }

    const std::string_view scheme = raw.substr(0, separator);
    const std::size_t rest_offset = separator + kSchemeSeparator.size();
    const std::string_view rest = raw.substr(rest_offset);
    if (rest.empty()) {
        return make_invalid(raw, errc::missing_target);
    }

    if (scheme == "unix") {
        endpoint parsed{};
        parsed.raw = std::string{raw};
        parsed.proto = protocol::unix_socket;
        parsed.path = std::string{rest};
        return parsed;
    }

    protocol proto = protocol::unknown;
    if (scheme == "tcp") {
        proto = protocol::tcp;
    } else if (scheme == "udp") {
        proto = protocol::udp;
    } else {
        return make_invalid(raw, errc::unsupported_protocol);
    }

    // Last colon of the whole string. When it belongs to "://" the target
    // carries no port at all.
    const std::size_t colon = raw.rfind(':');
    if (colon < rest_offset) {
        return make_invalid(raw, errc::missing_port);
    }

    const std::string_view host = raw.substr(rest_offset, colon - rest_offset);
    const std::string_view port = raw.substr(colon + 1);
    if (host.empty()) {
        return make_invalid(raw, errc::missing_host);
    }
    if (port.empty()) {
        return make_invalid(raw, errc::missing_port);
    }

    endpoint parsed{};
    parsed.raw = std::string{raw};
    parsed.proto = proto;
    parsed.host = std::string{host};
    parsed.port = std::string{port};
    return parsed;
}

} // namespace readygate
