#include "readygate/core/error.hpp"

namespace readygate {

namespace {

class readygate_error_category final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "readygate";
    }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
        case errc::missing_protocol:
            return "endpoint has no protocol";
        case errc::missing_target:
            return "endpoint has nothing after '://'";
        case errc::missing_host:
            return "endpoint has an empty host";
        case errc::missing_port:
            return "endpoint has an empty port";
        case errc::unsupported_protocol:
            return "unsupported protocol";
        case errc::invalid_port:
            return "unknown port or service";
        case errc::path_too_long:
            return "socket path too long";
        case errc::unsupported_platform:
            return "socket family not supported on this host";
        case errc::invalid_argument:
            return "invalid argument";
        case errc::timed_out:
            return "timed out";
        }
        return "unknown readygate error";
    }
};

} // namespace

const std::error_category& readygate_category() noexcept {
    static const readygate_error_category category;
    return category;
}

std::error_code make_error_code(errc value) noexcept {
    return std::error_code{static_cast<int>(value), readygate_category()};
}

error::error(std::error_code code) noexcept : code_(code) {}

error::error(errc value) noexcept : code_(make_error_code(value)) {}

error error::from_errno(int value) noexcept {
    return error{std::error_code{value, std::system_category()}};
}

std::error_code error::code() const noexcept {
    return code_;
}

int error::value() const noexcept {
    return code_.value();
}

std::string error::message() const {
    return code_.message();
}

bool error::is(errc value) const noexcept {
    return code_ == make_error_code(value);
}

error make_error_from_errno(int value) noexcept {
    return error::from_errno(value);
}

} // namespace readygate
